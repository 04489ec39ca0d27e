#pragma once

#include <docfed/adapters/adapter_factory.hpp>
#include <docfed/adapters/i_source_adapter.hpp>
#include <docfed/core/result.hpp>
#include <docfed/core/types.hpp>
#include <docfed/mapping/schema_mapping.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace docfed {

// ---------------------------------------------------------------------------
// DataSource: a registered external store.
// ---------------------------------------------------------------------------
struct DataSource {
    SourceId id = 0;
    std::string name;
    std::string type;  // adapter type token, e.g. "json-dir"
    SourceConfig config;
    std::vector<std::string> known_collections;  // as of the last connect
    SourceStatus status = SourceStatus::Disconnected;
};

// ---------------------------------------------------------------------------
// SourceRegistry: the engine's working set of data sources, their live
// adapters and the schema mappings.
//
// Both maps are immutable snapshots swapped under a unique lock; readers copy
// the current pointer under a shared lock and never see a partial update.
// ---------------------------------------------------------------------------
class SourceRegistry {
public:
    SourceRegistry(const AdapterFactory& factory, std::chrono::milliseconds connect_timeout);
    ~SourceRegistry();

    SourceRegistry(const SourceRegistry&) = delete;
    SourceRegistry& operator=(const SourceRegistry&) = delete;

    // -- Data sources --------------------------------------------------------

    /// Fails with Config on a duplicate id or an unknown type.
    [[nodiscard]] Result<void, Error> AddSource(DataSource source);

    /// Replace name, type and config. A config or type change disconnects
    /// the live adapter; the next query reconnects. NotFound if absent.
    [[nodiscard]] Result<void, Error> UpdateSource(DataSource source);

    /// Disconnect and forget. NotFound if absent.
    [[nodiscard]] Result<void, Error> RemoveSource(SourceId id);

    [[nodiscard]] std::optional<DataSource> FindSource(SourceId id) const;
    [[nodiscard]] std::vector<DataSource> ListSources() const;

    /// Live adapter for a source, connecting on first use. The connect is
    /// bounded by the connect timeout. On failure the source is marked
    /// `error` and a SourceConnection (or Timeout) error is returned.
    [[nodiscard]] Result<std::shared_ptr<ISourceAdapter>, Error> Connect(SourceId id);

    /// Disconnect every live adapter.
    void DisconnectAll();

    // -- Mappings ------------------------------------------------------------

    /// Fails with Config on a duplicate id, NotFound when the mapping's
    /// source is not registered.
    [[nodiscard]] Result<void, Error> AddMapping(SchemaMapping mapping);

    [[nodiscard]] Result<void, Error> RemoveMapping(MappingId id);

    [[nodiscard]] std::vector<SchemaMapping> ListMappings() const;

private:
    struct Entry {
        DataSource source;
        std::shared_ptr<ISourceAdapter> adapter;  // null until connected
    };

    using SourceMap = std::map<SourceId, Entry>;
    using MappingList = std::vector<SchemaMapping>;

    std::shared_ptr<const SourceMap> Sources() const;
    std::shared_ptr<std::mutex> ConnectLock(SourceId id);
    std::shared_ptr<ISourceAdapter> LiveAdapter(SourceId id) const;
    void SetStatus(SourceId id, SourceStatus status,
                   std::shared_ptr<ISourceAdapter> adapter,
                   std::optional<std::vector<std::string>> collections);

    const AdapterFactory& factory_;
    std::chrono::milliseconds connect_timeout_;

    mutable std::shared_mutex mutex_;
    std::shared_ptr<const SourceMap> sources_;
    std::shared_ptr<const MappingList> mappings_;

    // One lock per source id: a source is connected at most once at a time,
    // and a slow source never delays connects to the others.
    std::mutex connect_locks_mutex_;
    std::map<SourceId, std::shared_ptr<std::mutex>> connect_locks_;
};

} // namespace docfed
