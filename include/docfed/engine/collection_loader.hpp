#pragma once

#include <docfed/core/result.hpp>
#include <docfed/core/row.hpp>
#include <docfed/engine/clock.hpp>
#include <docfed/engine/snapshot_store.hpp>
#include <docfed/engine/source_registry.hpp>
#include <docfed/mapping/transform_registry.hpp>

#include <string>
#include <vector>

namespace docfed {

struct LoadedCollections {
    CollectionMap collections;
    std::vector<Error> warnings;  // recovered failures
};

// ---------------------------------------------------------------------------
// CollectionLoader: gathers the collections a query references from every
// selected source.
//
// For each source: connect, fetch each referenced collection it has, store a
// snapshot. A source that fails degrades to its latest snapshots. Rows of
// the same collection from several sources are concatenated in source order.
// Active mappings of the selected sources then fill in collections that are
// still missing.
//
// Fails with NotFound for an unregistered source id, and with
// SourceConnection only when every source failed and no snapshot was
// available for any of them.
// ---------------------------------------------------------------------------
class CollectionLoader {
public:
    CollectionLoader(SourceRegistry& registry, ISnapshotStore& snapshots,
                     const TransformRegistry& transforms, const IClock& clock,
                     bool annotate_source = false);

    CollectionLoader(const CollectionLoader&) = delete;
    CollectionLoader& operator=(const CollectionLoader&) = delete;

    [[nodiscard]] Result<LoadedCollections, Error> Load(
        const std::vector<SourceId>& source_ids,
        const std::vector<std::string>& collections);

private:
    // Latest snapshot rows for a collection; false when none exists.
    bool LoadFromSnapshot(SourceId id, const std::string& collection,
                          LoadedCollections& out);

    void Append(SourceId id, const std::string& collection, Rows rows,
                LoadedCollections& out) const;

    SourceRegistry& registry_;
    ISnapshotStore& snapshots_;
    const TransformRegistry& transforms_;
    const IClock& clock_;
    bool annotate_source_;
};

} // namespace docfed
