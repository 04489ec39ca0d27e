#pragma once

#include <docfed/core/result.hpp>
#include <docfed/core/row.hpp>
#include <docfed/core/types.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace docfed {

// ---------------------------------------------------------------------------
// CollectionSnapshot: one fetched copy of a collection. Superseded by a
// newer snapshot on refresh, never mutated.
// ---------------------------------------------------------------------------
struct CollectionSnapshot {
    SourceId source_id = 0;
    std::string collection;
    std::vector<FieldInfo> schema;
    Rows rows;
    Timestamp fetched_at;
};

using SnapshotPtr = std::shared_ptr<const CollectionSnapshot>;

Json SnapshotToJson(const CollectionSnapshot& snapshot);
Result<CollectionSnapshot, Error> SnapshotFromJson(const Json& json);

// ---------------------------------------------------------------------------
// ISnapshotStore: cache of the latest snapshot per (source, collection).
// ---------------------------------------------------------------------------
class ISnapshotStore {
public:
    virtual ~ISnapshotStore() = default;

    ISnapshotStore(const ISnapshotStore&) = delete;
    ISnapshotStore& operator=(const ISnapshotStore&) = delete;
    ISnapshotStore(ISnapshotStore&&) = delete;
    ISnapshotStore& operator=(ISnapshotStore&&) = delete;

    /// Latest snapshot, or nullptr when none was stored.
    [[nodiscard]] virtual Result<SnapshotPtr, Error> GetLatest(SourceId source_id,
                                                              const std::string& collection) = 0;

    /// Store a snapshot. An older snapshot than the stored one is ignored.
    [[nodiscard]] virtual Result<void, Error> Put(CollectionSnapshot snapshot) = 0;

    /// Drop every snapshot of a source.
    [[nodiscard]] virtual Result<void, Error> DropSource(SourceId source_id) = 0;

protected:
    ISnapshotStore() = default;
};

class InMemorySnapshotStore : public ISnapshotStore {
public:
    InMemorySnapshotStore() = default;

    [[nodiscard]] Result<SnapshotPtr, Error> GetLatest(SourceId source_id,
                                                      const std::string& collection) override;
    [[nodiscard]] Result<void, Error> Put(CollectionSnapshot snapshot) override;
    [[nodiscard]] Result<void, Error> DropSource(SourceId source_id) override;

private:
    std::mutex mutex_;
    std::map<CollectionRef, SnapshotPtr> snapshots_;
};

// ---------------------------------------------------------------------------
// FileSnapshotStore: one JSON file per (source, collection) in a directory,
// named "<sourceId>__<collection>.json". Reads are served from memory after
// the first load.
// ---------------------------------------------------------------------------
class FileSnapshotStore : public ISnapshotStore {
    // Only Open can name this, so only Open constructs a store.
    struct OpenKey {
        explicit OpenKey() = default;
    };

public:
    /// Creates the directory if needed.
    static Result<std::unique_ptr<FileSnapshotStore>, Error> Open(
        const std::filesystem::path& dir);

    FileSnapshotStore(OpenKey, std::filesystem::path dir);

    [[nodiscard]] Result<SnapshotPtr, Error> GetLatest(SourceId source_id,
                                                      const std::string& collection) override;
    [[nodiscard]] Result<void, Error> Put(CollectionSnapshot snapshot) override;
    [[nodiscard]] Result<void, Error> DropSource(SourceId source_id) override;

    [[nodiscard]] std::filesystem::path FileFor(SourceId source_id,
                                                const std::string& collection) const;

private:
    std::filesystem::path dir_;
    std::mutex mutex_;
    std::map<CollectionRef, SnapshotPtr> cache_;
};

} // namespace docfed
