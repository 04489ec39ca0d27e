#pragma once

#include <docfed/core/result.hpp>
#include <docfed/core/row.hpp>
#include <docfed/query/query_ast.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace docfed {

// ---------------------------------------------------------------------------
// SourceConfig: connection settings of a data source. `settings` is the
// flat key/value map from the configuration file ("path", ...);
// `collections` carries the documents of an inline source.
// ---------------------------------------------------------------------------
struct SourceConfig {
    std::map<std::string, std::string> settings;
    CollectionMap collections;

    [[nodiscard]] std::optional<std::string> Setting(const std::string& key) const {
        auto it = settings.find(key);
        if (it == settings.end()) return std::nullopt;
        return it->second;
    }

    bool operator==(const SourceConfig& other) const {
        return settings == other.settings && collections == other.collections;
    }
    bool operator!=(const SourceConfig& other) const { return !(*this == other); }
};

struct FilterClause {
    std::string field;
    CompareOp op = CompareOp::Eq;
    Value value;
};

struct SortClause {
    std::string field;
    bool descending = false;
};

// ---------------------------------------------------------------------------
// FilterSpec: pushdown hints for ExecuteQuery. An empty spec fetches the
// whole collection.
// ---------------------------------------------------------------------------
struct FilterSpec {
    std::vector<FilterClause> filters;
    std::vector<SortClause> order_by;
    std::optional<size_t> limit;
    std::vector<std::string> columns;  // empty means all columns

    [[nodiscard]] bool IsEmpty() const {
        return filters.empty() && order_by.empty() && !limit && columns.empty();
    }
};

/// Apply a FilterSpec to rows in memory, for adapters without native
/// filtering.
Rows ApplyFilterSpec(const Rows& rows, const FilterSpec& spec);

// ---------------------------------------------------------------------------
// ISourceAdapter: uniform access to one data source.
//
// The engine depends on this interface rather than on any concrete store,
// which allows offline testing via MockSourceAdapter. An adapter instance is
// shared by concurrent queries once connected, so implementations must be
// safe to call from several threads.
//
// Methods return Result<T, Error>; fetch failures use the SourceConnection
// category.
// ---------------------------------------------------------------------------
class ISourceAdapter {
public:
    virtual ~ISourceAdapter() = default;

    ISourceAdapter(const ISourceAdapter&) = delete;
    ISourceAdapter& operator=(const ISourceAdapter&) = delete;
    ISourceAdapter(ISourceAdapter&&) = delete;
    ISourceAdapter& operator=(ISourceAdapter&&) = delete;

    [[nodiscard]] virtual Result<void, Error> Connect(const SourceConfig& config) = 0;

    [[nodiscard]] virtual Result<std::vector<std::string>, Error> ListCollections() = 0;

    /// Inferred schema, or nullopt when the collection does not exist.
    [[nodiscard]] virtual Result<std::optional<std::vector<FieldInfo>>, Error>
    GetCollectionSchema(const std::string& collection) = 0;

    [[nodiscard]] virtual Result<Rows, Error> ExecuteQuery(const std::string& collection,
                                                           const FilterSpec& spec) = 0;

    virtual void Disconnect() = 0;

    [[nodiscard]] virtual bool IsConnected() const = 0;

protected:
    ISourceAdapter() = default;
};

} // namespace docfed
