#include <docfed/engine/federation_engine.hpp>

#include <docfed/core/log.hpp>

#include <algorithm>
#include <sstream>

namespace docfed {

namespace {

std::shared_ptr<const IClock> OrSystemClock(std::shared_ptr<const IClock> clock) {
    if (clock) return clock;
    return std::make_shared<SystemClock>();
}

std::unique_ptr<ISnapshotStore> OrInMemory(std::unique_ptr<ISnapshotStore> store) {
    if (store) return store;
    return std::make_unique<InMemorySnapshotStore>();
}

std::string JoinIds(const std::vector<SourceId>& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += ",";
        out += std::to_string(ids[i]);
    }
    return out;
}

} // anonymous namespace

FederationEngine::FederationEngine(EngineOptions options,
                                   std::unique_ptr<ISnapshotStore> snapshots,
                                   AdapterFactory factory,
                                   std::shared_ptr<const IClock> clock,
                                   IResultStore* result_store)
    : options_(options),
      factory_(std::move(factory)),
      clock_(OrSystemClock(std::move(clock))),
      snapshots_(OrInMemory(std::move(snapshots))),
      registry_(factory_, options_.connect_timeout),
      loader_(registry_, *snapshots_, transforms_, *clock_, options_.annotate_source),
      strategies_(*clock_, options_.refresh_interval, options_.refresh_workers, result_store) {}

FederationEngine::~FederationEngine() = default;

// ===========================================================================
// Queries
// ===========================================================================

std::string FederationEngine::CacheKey(const FederatedQuery& query,
                                       const ParsedQuery& parsed) const {
    if (query.id) {
        return "saved:" + std::to_string(*query.id);
    }
    std::ostringstream key;
    key << "adhoc:" << ToQueryText(parsed) << "|" << JoinIds(query.source_ids);
    for (const auto& [name, value] : query.params) {
        key << "|" << name << "=" << ValueToJson(value).dump();
    }
    return key.str();
}

Result<FederatedResult, Error> FederationEngine::Execute(const ParsedQuery& parsed,
                                                         const std::vector<SourceId>& source_ids,
                                                         const QueryParams& params) {
    auto loaded = loader_.Load(source_ids, parsed.ReferencedCollections());
    if (loaded.IsErr()) {
        return Result<FederatedResult, Error>::Err(std::move(loaded).Error());
    }
    LoadedCollections collections = std::move(loaded).Value();

    FederatedResult result;
    result.warnings = std::move(collections.warnings);
    auto rows = executor_.Execute(parsed, collections.collections, params, &result.warnings);
    if (rows.IsErr()) {
        return Result<FederatedResult, Error>::Err(std::move(rows).Error());
    }
    result.rows = std::move(rows).Value();
    return Result<FederatedResult, Error>::Ok(std::move(result));
}

Result<FederatedResult, Error> FederationEngine::ExecuteFederatedQuery(const FederatedQuery& query) {
    using R = Result<FederatedResult, Error>;
    if (query.source_ids.empty()) {
        return R::Err(Error::Make(ErrorCategory::Config, "ExecuteFederatedQuery", "",
                                  "At least one data source must be selected"));
    }

    auto parsed = ParseQuery(query.text);
    if (parsed.IsErr()) {
        return R::Err(std::move(parsed).Error());
    }
    ParsedQuery ast = std::move(parsed).Value();

    // Fail on missing bindings before any source is contacted.
    auto bound = BindParameters(ast.where, query.params);
    if (bound.IsErr()) {
        return R::Err(std::move(bound).Error());
    }

    for (SourceId id : query.source_ids) {
        if (!registry_.FindSource(id)) {
            return R::Err(Error::Make(ErrorCategory::NotFound, "ExecuteFederatedQuery",
                                      std::to_string(id),
                                      "Data source " + std::to_string(id) + " is not registered"));
        }
    }

    const std::string key = CacheKey(query, ast);
    LogInfo("engine", "Running query [" + std::string(FederationStrategyName(query.strategy)) +
                          "] on sources " + JoinIds(query.source_ids) + ": " + ToQueryText(ast));

    auto result = strategies_.Run(
        key, query.strategy,
        [this, ast, source_ids = query.source_ids, params = query.params] {
            return Execute(ast, source_ids, params);
        });

    if (result.IsOk()) {
        LogInfo("engine", std::to_string(result.Value().rows.size()) + " row(s)" +
                              (result.Value().cache_hit ? " from cache" : "") + " in " +
                              std::to_string(result.Value().execution_time_ms) + " ms");
    } else {
        LogWarn("engine", result.Error().ToString());
    }
    return result;
}

Result<FederatedResult, Error> FederationEngine::ExecuteSavedQuery(QueryId id,
                                                                  const QueryParams& params) {
    auto saved = FindSavedQuery(id);
    if (!saved) {
        return Result<FederatedResult, Error>::Err(Error::Make(
            ErrorCategory::NotFound, "ExecuteSavedQuery", std::to_string(id),
            "Saved query " + std::to_string(id) + " does not exist"));
    }
    FederatedQuery query;
    query.id = saved->id;
    query.text = saved->text;
    query.source_ids = saved->source_ids;
    query.params = params;
    query.strategy = saved->strategy;
    return ExecuteFederatedQuery(query);
}

SyntaxCheck FederationEngine::ValidateQuerySyntax(std::string_view text) const {
    return docfed::ValidateQuerySyntax(text);
}

Result<std::optional<std::vector<FieldInfo>>, Error> FederationEngine::GetLogicalCollectionSchema(
    SourceId source_id, const std::string& collection) {
    using Schema = std::optional<std::vector<FieldInfo>>;
    using R = Result<Schema, Error>;

    if (!registry_.FindSource(source_id)) {
        return R::Err(Error::Make(ErrorCategory::NotFound, "GetLogicalCollectionSchema",
                                  std::to_string(source_id),
                                  "Data source " + std::to_string(source_id) +
                                      " is not registered"));
    }

    auto snapshot = snapshots_->GetLatest(source_id, collection);
    if (snapshot.IsOk() && snapshot.Value()) {
        return R::Ok(Schema(snapshot.Value()->schema));
    }
    if (snapshot.IsErr()) {
        LogWarn("engine", snapshot.Error().ToString());
    }

    for (const auto& mapping : registry_.ListMappings()) {
        if (!mapping.IsActive() || mapping.target.source_id != source_id ||
            mapping.target.collection != collection) {
            continue;
        }
        if (!registry_.FindSource(mapping.source.source_id)) continue;
        auto loaded = loader_.Load({mapping.source.source_id}, {mapping.source.collection});
        if (loaded.IsErr()) {
            LogWarn("engine", loaded.Error().ToString());
            continue;
        }
        const auto& collections = loaded.Value().collections;
        auto it = collections.find(mapping.source.collection);
        if (it == collections.end()) continue;
        Rows mapped = ApplyMapping(it->second, mapping, MappingDirection::SourceToTarget,
                                   transforms_);
        return R::Ok(Schema(InferSchema(mapped)));
    }

    auto adapter = registry_.Connect(source_id);
    if (adapter.IsErr()) {
        return R::Err(std::move(adapter).Error());
    }
    return adapter.Value()->GetCollectionSchema(collection);
}

Result<std::vector<std::string>, Error> FederationEngine::ListCollections(SourceId source_id) {
    auto adapter = registry_.Connect(source_id);
    if (adapter.IsErr()) {
        return Result<std::vector<std::string>, Error>::Err(std::move(adapter).Error());
    }
    return adapter.Value()->ListCollections();
}

// ===========================================================================
// Configuration changes
// ===========================================================================

Result<void, Error> FederationEngine::AddDataSource(DataSource source) {
    auto added = registry_.AddSource(std::move(source));
    if (added.IsOk()) strategies_.Clear();
    return added;
}

Result<void, Error> FederationEngine::UpdateDataSource(DataSource source) {
    auto updated = registry_.UpdateSource(std::move(source));
    if (updated.IsOk()) strategies_.Clear();
    return updated;
}

Result<void, Error> FederationEngine::RemoveDataSource(SourceId id) {
    auto removed = registry_.RemoveSource(id);
    if (removed.IsErr()) {
        return removed;
    }
    for (const auto& mapping : registry_.ListMappings()) {
        if (mapping.source.source_id == id) {
            auto dropped = registry_.RemoveMapping(mapping.id);
            if (dropped.IsErr()) LogWarn("engine", dropped.Error().ToString());
        }
    }
    auto cleared = snapshots_->DropSource(id);
    if (cleared.IsErr()) {
        LogWarn("engine", cleared.Error().ToString());
    }
    strategies_.Clear();
    return Result<void, Error>::Ok();
}

std::vector<DataSource> FederationEngine::ListDataSources() const {
    return registry_.ListSources();
}

Result<void, Error> FederationEngine::AddMapping(SchemaMapping mapping) {
    auto added = registry_.AddMapping(std::move(mapping));
    if (added.IsOk()) strategies_.Clear();
    return added;
}

Result<void, Error> FederationEngine::RemoveMapping(MappingId id) {
    auto removed = registry_.RemoveMapping(id);
    if (removed.IsOk()) strategies_.Clear();
    return removed;
}

std::vector<SchemaMapping> FederationEngine::ListMappings() const {
    return registry_.ListMappings();
}

Result<void, Error> FederationEngine::AddSavedQuery(SavedQuery query) {
    auto check = docfed::ValidateQuerySyntax(query.text);
    if (!check.valid) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Syntax, "AddSavedQuery", std::to_string(query.id),
            "Saved query '" + query.name + "' does not parse", check.error));
    }
    std::lock_guard<std::mutex> lock(queries_mutex_);
    if (saved_queries_.count(query.id) > 0) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Config, "AddSavedQuery", std::to_string(query.id),
            "A saved query with this id already exists"));
    }
    const QueryId id = query.id;
    saved_queries_.emplace(id, std::move(query));
    return Result<void, Error>::Ok();
}

Result<void, Error> FederationEngine::RemoveSavedQuery(QueryId id) {
    {
        std::lock_guard<std::mutex> lock(queries_mutex_);
        if (saved_queries_.erase(id) == 0) {
            return Result<void, Error>::Err(Error::Make(
                ErrorCategory::NotFound, "RemoveSavedQuery", std::to_string(id),
                "Saved query " + std::to_string(id) + " does not exist"));
        }
    }
    strategies_.Invalidate("saved:" + std::to_string(id));
    return Result<void, Error>::Ok();
}

std::optional<SavedQuery> FederationEngine::FindSavedQuery(QueryId id) const {
    std::lock_guard<std::mutex> lock(queries_mutex_);
    auto it = saved_queries_.find(id);
    if (it == saved_queries_.end()) return std::nullopt;
    return it->second;
}

std::vector<SavedQuery> FederationEngine::ListSavedQueries() const {
    std::lock_guard<std::mutex> lock(queries_mutex_);
    std::vector<SavedQuery> out;
    for (const auto& [id, query] : saved_queries_) out.push_back(query);
    return out;
}

void FederationEngine::RegisterTransform(const std::string& name, TransformFn fn) {
    transforms_.Register(name, std::move(fn));
}

void FederationEngine::WaitForRefreshes() {
    strategies_.WaitForRefreshes();
}

} // namespace docfed
