#pragma once

#include <docfed/core/result.hpp>
#include <docfed/core/row.hpp>
#include <docfed/core/types.hpp>
#include <docfed/mapping/transform_registry.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace docfed {

enum class RuleKind {
    Direct,     // copy the value verbatim
    Transform,  // pass through a built-in transform
    Custom,     // caller-registered transform, else behaves as Direct
};

/// Accepts "direct", "transform" or "custom".
Result<RuleKind, Error> ParseRuleKind(std::string_view token);
const char* RuleKindName(RuleKind kind);

enum class MappingStatus {
    Active,
    Inactive,
};

/// Accepts "active" or "inactive".
Result<MappingStatus, Error> ParseMappingStatus(std::string_view token);
const char* MappingStatusName(MappingStatus status);

struct MappingRule {
    std::string source_field;
    std::string target_field;
    RuleKind kind = RuleKind::Direct;
    std::string transform;  // transform name for Transform and Custom rules

    bool operator==(const MappingRule& other) const {
        return source_field == other.source_field &&
               target_field == other.target_field && kind == other.kind &&
               transform == other.transform;
    }
};

// ---------------------------------------------------------------------------
// SchemaMapping: field-level rules deriving the target collection from the
// source collection. Rules are independent of each other and of their order.
// ---------------------------------------------------------------------------
struct SchemaMapping {
    MappingId id = 0;
    std::string name;
    CollectionRef source;
    CollectionRef target;
    std::vector<MappingRule> rules;
    MappingStatus status = MappingStatus::Active;

    [[nodiscard]] bool IsActive() const noexcept { return status == MappingStatus::Active; }

    bool operator==(const SchemaMapping& other) const {
        return id == other.id && name == other.name && source == other.source &&
               target == other.target && rules == other.rules && status == other.status;
    }
};

enum class MappingDirection {
    SourceToTarget,
    TargetToSource,  // maps target_field back to source_field, no transform
};

/// Map every row of `rows` through the mapping's rules. Fields absent on a
/// row are omitted from the mapped row. A mapping without rules returns the
/// rows unchanged. Unknown transform names leave the value unchanged and
/// append one MappingSynthesis warning per rule.
Rows ApplyMapping(const Rows& rows, const SchemaMapping& mapping,
                  MappingDirection direction, const TransformRegistry& transforms,
                  std::vector<Error>* warnings = nullptr);

/// Derive collections that are missing from `available`. Each active mapping
/// whose target collection is absent and whose source collection is present
/// contributes one entry; when several mappings target the same collection
/// the first in list order wins. `available` is not modified; only the new
/// entries are returned.
CollectionMap SynthesizeCollections(const std::vector<SchemaMapping>& mappings,
                                    const CollectionMap& available,
                                    const TransformRegistry& transforms,
                                    std::vector<Error>* warnings = nullptr);

} // namespace docfed
