#include <docfed/mapping/schema_mapping.hpp>

#include <docfed/core/log.hpp>

#include <set>
#include <string>
#include <vector>

namespace docfed {

namespace {

std::string JoinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) joined += ", ";
        joined += name;
    }
    return joined;
}

} // anonymous namespace

Result<RuleKind, Error> ParseRuleKind(std::string_view token) {
    if (token == "direct") return Result<RuleKind, Error>::Ok(RuleKind::Direct);
    if (token == "transform") return Result<RuleKind, Error>::Ok(RuleKind::Transform);
    if (token == "custom") return Result<RuleKind, Error>::Ok(RuleKind::Custom);
    return Result<RuleKind, Error>::Err(Error::Make(
        ErrorCategory::Config, "ParseRuleKind", std::string(token),
        "Unknown mapping rule kind (expected direct, transform or custom)"));
}

const char* RuleKindName(RuleKind kind) {
    switch (kind) {
        case RuleKind::Direct:    return "direct";
        case RuleKind::Transform: return "transform";
        case RuleKind::Custom:    return "custom";
    }
    return "direct";
}

Result<MappingStatus, Error> ParseMappingStatus(std::string_view token) {
    if (token == "active") return Result<MappingStatus, Error>::Ok(MappingStatus::Active);
    if (token == "inactive") return Result<MappingStatus, Error>::Ok(MappingStatus::Inactive);
    return Result<MappingStatus, Error>::Err(Error::Make(
        ErrorCategory::Config, "ParseMappingStatus", std::string(token),
        "Unknown mapping status (expected active or inactive)"));
}

const char* MappingStatusName(MappingStatus status) {
    return status == MappingStatus::Active ? "active" : "inactive";
}

Rows ApplyMapping(const Rows& rows, const SchemaMapping& mapping,
                  MappingDirection direction, const TransformRegistry& transforms,
                  std::vector<Error>* warnings) {
    if (mapping.rules.empty()) {
        return rows;
    }

    const bool forward = direction == MappingDirection::SourceToTarget;
    std::set<size_t> warned;

    Rows out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        Row mapped;
        for (size_t i = 0; i < mapping.rules.size(); ++i) {
            const auto& rule = mapping.rules[i];
            const std::string& from = forward ? rule.source_field : rule.target_field;
            const std::string& to = forward ? rule.target_field : rule.source_field;

            const Value* value = row.Find(from);
            if (value == nullptr) {
                continue;
            }
            if (!forward || rule.kind == RuleKind::Direct) {
                mapped.Set(to, *value);
                continue;
            }
            if (rule.kind == RuleKind::Custom) {
                mapped.Set(to, transforms.Apply(rule.transform, *value));
                continue;
            }

            bool found = false;
            mapped.Set(to, transforms.Apply(rule.transform, *value, &found));
            if (!found && warned.insert(i).second) {
                auto warning = Error::Make(
                    ErrorCategory::MappingSynthesis, "ApplyMapping", mapping.name,
                    "Unknown transform '" + rule.transform + "' on field " +
                        rule.source_field + "; value left unchanged",
                    "known transforms: " + JoinNames(transforms.Names()));
                LogWarn("mapping", warning.ToString());
                if (warnings) warnings->push_back(std::move(warning));
            }
        }
        out.push_back(std::move(mapped));
    }
    return out;
}

CollectionMap SynthesizeCollections(const std::vector<SchemaMapping>& mappings,
                                    const CollectionMap& available,
                                    const TransformRegistry& transforms,
                                    std::vector<Error>* warnings) {
    CollectionMap derived;
    for (const auto& mapping : mappings) {
        if (!mapping.IsActive()) continue;

        const std::string& target = mapping.target.collection;
        if (available.count(target) > 0 || derived.count(target) > 0) continue;

        auto source = available.find(mapping.source.collection);
        if (source == available.end()) continue;

        LogDebug("mapping", "Synthesizing '" + target + "' from '" +
                                mapping.source.collection + "' via " + mapping.name);
        derived.emplace(target, ApplyMapping(source->second, mapping,
                                             MappingDirection::SourceToTarget,
                                             transforms, warnings));
    }
    return derived;
}

} // namespace docfed
