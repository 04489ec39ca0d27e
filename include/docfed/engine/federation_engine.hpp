#pragma once

#include <docfed/adapters/adapter_factory.hpp>
#include <docfed/core/result.hpp>
#include <docfed/core/types.hpp>
#include <docfed/engine/clock.hpp>
#include <docfed/engine/collection_loader.hpp>
#include <docfed/engine/executor.hpp>
#include <docfed/engine/federated_result.hpp>
#include <docfed/engine/snapshot_store.hpp>
#include <docfed/engine/source_registry.hpp>
#include <docfed/engine/strategy_controller.hpp>
#include <docfed/mapping/schema_mapping.hpp>
#include <docfed/mapping/transform_registry.hpp>
#include <docfed/query/query_parser.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docfed {

struct EngineOptions {
    std::chrono::minutes refresh_interval{15};
    std::chrono::milliseconds connect_timeout{10000};
    bool annotate_source = false;  // add "__source" to fetched rows
    size_t refresh_workers = 1;
};

// A query stored in the configuration and run by id.
struct SavedQuery {
    QueryId id = 0;
    std::string name;
    std::string text;
    std::vector<SourceId> source_ids;
    FederationStrategy strategy = FederationStrategy::Virtual;
};

struct FederatedQuery {
    std::optional<QueryId> id;  // cache key of a saved query
    std::string text;
    std::vector<SourceId> source_ids;
    QueryParams params;
    FederationStrategy strategy = FederationStrategy::Virtual;
};

// ---------------------------------------------------------------------------
// FederationEngine: entry point for running federated queries and for
// changing the set of sources, mappings and saved queries.
//
// Owns the registry, snapshot store, loader and strategy controller.
// Construct once and pass by reference; all methods are thread-safe.
// ---------------------------------------------------------------------------
class FederationEngine {
public:
    explicit FederationEngine(EngineOptions options = {},
                              std::unique_ptr<ISnapshotStore> snapshots = nullptr,
                              AdapterFactory factory = AdapterFactory::WithBuiltins(),
                              std::shared_ptr<const IClock> clock = nullptr,
                              IResultStore* result_store = nullptr);
    ~FederationEngine();

    FederationEngine(const FederationEngine&) = delete;
    FederationEngine& operator=(const FederationEngine&) = delete;

    // -- Queries -------------------------------------------------------------

    /// Parse, fetch, execute under the query's strategy. Syntax and missing
    /// parameters are reported before any source is contacted.
    [[nodiscard]] Result<FederatedResult, Error> ExecuteFederatedQuery(const FederatedQuery& query);

    /// Run a saved query with its own sources and strategy.
    [[nodiscard]] Result<FederatedResult, Error> ExecuteSavedQuery(QueryId id,
                                                                  const QueryParams& params);

    [[nodiscard]] SyntaxCheck ValidateQuerySyntax(std::string_view text) const;

    /// Schema of a collection as the engine sees it: latest snapshot first,
    /// then a mapping that synthesizes it, then the live adapter. nullopt
    /// when none of them knows the collection.
    [[nodiscard]] Result<std::optional<std::vector<FieldInfo>>, Error>
    GetLogicalCollectionSchema(SourceId source_id, const std::string& collection);

    /// Collections a source currently exposes (connects if needed).
    [[nodiscard]] Result<std::vector<std::string>, Error> ListCollections(SourceId source_id);

    // -- Configuration changes -----------------------------------------------
    // Each change drops cached results.

    [[nodiscard]] Result<void, Error> AddDataSource(DataSource source);
    [[nodiscard]] Result<void, Error> UpdateDataSource(DataSource source);
    /// Also drops the source's snapshots and the mappings reading from it.
    [[nodiscard]] Result<void, Error> RemoveDataSource(SourceId id);
    [[nodiscard]] std::vector<DataSource> ListDataSources() const;

    [[nodiscard]] Result<void, Error> AddMapping(SchemaMapping mapping);
    [[nodiscard]] Result<void, Error> RemoveMapping(MappingId id);
    [[nodiscard]] std::vector<SchemaMapping> ListMappings() const;

    [[nodiscard]] Result<void, Error> AddSavedQuery(SavedQuery query);
    [[nodiscard]] Result<void, Error> RemoveSavedQuery(QueryId id);
    [[nodiscard]] std::optional<SavedQuery> FindSavedQuery(QueryId id) const;
    [[nodiscard]] std::vector<SavedQuery> ListSavedQueries() const;

    // -- Extension points ----------------------------------------------------

    /// Register a function for `custom` mapping rules. Call before queries run.
    void RegisterTransform(const std::string& name, TransformFn fn);

    /// Block until hybrid background refreshes have finished.
    void WaitForRefreshes();

private:
    std::string CacheKey(const FederatedQuery& query, const ParsedQuery& parsed) const;
    Result<FederatedResult, Error> Execute(const ParsedQuery& parsed,
                                           const std::vector<SourceId>& source_ids,
                                           const QueryParams& params);

    EngineOptions options_;
    AdapterFactory factory_;
    std::shared_ptr<const IClock> clock_;
    std::unique_ptr<ISnapshotStore> snapshots_;
    TransformRegistry transforms_;
    FederationExecutor executor_;
    SourceRegistry registry_;
    CollectionLoader loader_;

    mutable std::mutex queries_mutex_;
    std::map<QueryId, SavedQuery> saved_queries_;

    // Last: its refresh threads call back into the members above and are
    // joined when it is destroyed.
    StrategyController strategies_;
};

} // namespace docfed
