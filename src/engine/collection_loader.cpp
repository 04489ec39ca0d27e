#include <docfed/engine/collection_loader.hpp>

#include <docfed/core/log.hpp>
#include <docfed/mapping/schema_mapping.hpp>

#include <algorithm>
#include <set>

namespace docfed {

namespace {

constexpr const char* kSourceField = "__source";

} // anonymous namespace

CollectionLoader::CollectionLoader(SourceRegistry& registry, ISnapshotStore& snapshots,
                                   const TransformRegistry& transforms, const IClock& clock,
                                   bool annotate_source)
    : registry_(registry),
      snapshots_(snapshots),
      transforms_(transforms),
      clock_(clock),
      annotate_source_(annotate_source) {}

void CollectionLoader::Append(SourceId id, const std::string& collection, Rows rows,
                              LoadedCollections& out) const {
    if (annotate_source_) {
        for (auto& row : rows) row.Set(kSourceField, Value(static_cast<int64_t>(id)));
    }
    Rows& target = out.collections[collection];
    if (target.empty()) {
        target = std::move(rows);
    } else {
        target.insert(target.end(), std::make_move_iterator(rows.begin()),
                      std::make_move_iterator(rows.end()));
    }
}

bool CollectionLoader::LoadFromSnapshot(SourceId id, const std::string& collection,
                                        LoadedCollections& out) {
    auto snapshot = snapshots_.GetLatest(id, collection);
    if (snapshot.IsErr()) {
        LogWarn("loader", snapshot.Error().ToString());
        out.warnings.push_back(std::move(snapshot).Error());
        return false;
    }
    const SnapshotPtr& latest = snapshot.Value();
    if (!latest) {
        return false;
    }
    LogInfo("loader", "Serving '" + collection + "' of source " + std::to_string(id) +
                          " from snapshot taken " + FormatTimestamp(latest->fetched_at));
    Append(id, collection, latest->rows, out);
    return true;
}

Result<LoadedCollections, Error> CollectionLoader::Load(
    const std::vector<SourceId>& source_ids,
    const std::vector<std::string>& collections) {
    using R = Result<LoadedCollections, Error>;

    for (SourceId id : source_ids) {
        if (!registry_.FindSource(id)) {
            return R::Err(Error::Make(ErrorCategory::NotFound, "LoadCollections",
                                      std::to_string(id),
                                      "Data source " + std::to_string(id) + " is not registered"));
        }
    }

    // Mapped collections need their source collections fetched as well.
    const std::set<SourceId> selected(source_ids.begin(), source_ids.end());
    std::vector<SchemaMapping> mappings;
    for (auto& mapping : registry_.ListMappings()) {
        if (mapping.IsActive() && selected.count(mapping.source.source_id) > 0) {
            mappings.push_back(std::move(mapping));
        }
    }
    std::vector<std::string> wanted = collections;
    for (const auto& mapping : mappings) {
        const bool target_wanted = std::find(collections.begin(), collections.end(),
                                             mapping.target.collection) != collections.end();
        if (target_wanted && std::find(wanted.begin(), wanted.end(),
                                       mapping.source.collection) == wanted.end()) {
            wanted.push_back(mapping.source.collection);
        }
    }

    LoadedCollections out;
    bool any_data = false;
    std::optional<Error> first_failure;

    for (SourceId id : source_ids) {
        auto adapter = registry_.Connect(id);
        if (adapter.IsErr()) {
            auto error = std::move(adapter).Error();
            bool served = false;
            for (const auto& collection : wanted) {
                served = LoadFromSnapshot(id, collection, out) || served;
            }
            any_data = any_data || served;
            if (!first_failure) first_failure = error;
            out.warnings.push_back(std::move(error));
            continue;
        }
        any_data = true;

        const auto source = registry_.FindSource(id);
        const std::vector<std::string> known =
            source ? source->known_collections : std::vector<std::string>{};

        for (const auto& collection : wanted) {
            if (std::find(known.begin(), known.end(), collection) == known.end()) {
                continue;
            }
            auto rows = adapter.Value()->ExecuteQuery(collection, FilterSpec{});
            if (rows.IsErr()) {
                auto error = std::move(rows).Error();
                LogWarn("loader", error.ToString());
                out.warnings.push_back(std::move(error));
                LoadFromSnapshot(id, collection, out);
                continue;
            }

            CollectionSnapshot snapshot;
            snapshot.source_id = id;
            snapshot.collection = collection;
            snapshot.rows = rows.Value();
            snapshot.schema = InferSchema(snapshot.rows);
            snapshot.fetched_at = clock_.Now();
            if (auto stored = snapshots_.Put(std::move(snapshot)); stored.IsErr()) {
                LogWarn("loader", "Snapshot not stored: " + stored.Error().ToString());
            }

            LogDebug("loader", "Fetched " + std::to_string(rows.Value().size()) +
                                   " row(s) of '" + collection + "' from source " +
                                   std::to_string(id));
            Append(id, collection, std::move(rows).Value(), out);
        }
    }

    if (!any_data && first_failure) {
        return R::Err(Error::Make(ErrorCategory::SourceConnection, "LoadCollections", "",
                                  "No selected data source could be reached",
                                  first_failure->ToString()));
    }

    CollectionMap derived = SynthesizeCollections(mappings, out.collections, transforms_,
                                                  &out.warnings);
    for (auto& [name, rows] : derived) {
        LogDebug("loader", "Synthesized '" + name + "' (" + std::to_string(rows.size()) +
                               " row(s))");
        out.collections.emplace(name, std::move(rows));
    }

    return R::Ok(std::move(out));
}

} // namespace docfed
