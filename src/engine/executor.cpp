#include <docfed/engine/executor.hpp>

#include <docfed/core/log.hpp>

#include <algorithm>
#include <numeric>
#include <set>

namespace docfed {

namespace {

const Rows& EmptyRows() {
    static const Rows kEmpty;
    return kEmpty;
}

const Rows& CollectionOrEmpty(const CollectionMap& collections, const std::string& name) {
    auto it = collections.find(name);
    return it == collections.end() ? EmptyRows() : it->second;
}

Value ReadField(const Row& row, const FieldRef& field) {
    const Value* v = LookupField(row, field);
    return v ? *v : Value();
}

bool ReferencesAny(const FieldRef& field, const std::set<std::string>& tables) {
    return field.IsQualified() && tables.count(field.table) > 0;
}

// Conditions that name a joined collection can only hold once its fields are
// on the row.
bool IsPostJoin(const Condition& cond, const std::set<std::string>& joined) {
    if (ReferencesAny(cond.field, joined)) return true;
    if (const auto* other = std::get_if<FieldRef>(&cond.operand)) {
        return ReferencesAny(*other, joined);
    }
    return false;
}

int CompareByKeys(const Row& a, const Row& b, const std::vector<OrderKey>& keys) {
    for (const auto& key : keys) {
        int cmp = CompareForSort(ReadField(a, key.field), ReadField(b, key.field));
        if (key.direction == SortDirection::Desc) cmp = -cmp;
        if (cmp != 0) return cmp;
    }
    return 0;
}

} // anonymous namespace

const Value* LookupField(const Row& row, const FieldRef& field) {
    if (field.IsQualified()) {
        if (const Value* v = row.Find(field.Qualified())) {
            return v;
        }
    }
    if (const Value* v = row.Find(field.name)) {
        return v;
    }
    if (field.IsQualified()) {
        return nullptr;
    }
    // Unqualified name falls back to the first joined "<collection>.<name>".
    const std::string suffix = "." + field.name;
    for (const auto& [name, value] : row) {
        if (name.size() > suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return &value;
        }
    }
    return nullptr;
}

Result<std::vector<Condition>, Error> BindParameters(const std::vector<Condition>& conditions,
                                                     const QueryParams& params) {
    std::vector<Condition> bound;
    bound.reserve(conditions.size());
    for (const auto& cond : conditions) {
        Condition copy = cond;
        if (const auto* param = std::get_if<ParamRef>(&cond.operand)) {
            auto it = params.find(param->name);
            if (it == params.end()) {
                return Result<std::vector<Condition>, Error>::Err(Error::Make(
                    ErrorCategory::UnknownParameter, "BindParameters", ":" + param->name,
                    "No value supplied for query parameter '" + param->name + "'"));
            }
            copy.operand = it->second;
        }
        bound.push_back(std::move(copy));
    }
    return Result<std::vector<Condition>, Error>::Ok(std::move(bound));
}

bool EvaluateCondition(const Row& row, const Condition& condition) {
    const Value lhs = ReadField(row, condition.field);
    Value rhs;
    if (const auto* literal = std::get_if<Value>(&condition.operand)) {
        rhs = *literal;
    } else if (const auto* other = std::get_if<FieldRef>(&condition.operand)) {
        rhs = ReadField(row, *other);
    } else {
        return false;
    }

    switch (condition.op) {
        case CompareOp::Eq: return ValuesEqual(lhs, rhs);
        case CompareOp::Ne: return !ValuesEqual(lhs, rhs);
        default: break;
    }
    const auto cmp = CompareValues(lhs, rhs);
    if (!cmp.has_value()) {
        return false;
    }
    switch (condition.op) {
        case CompareOp::Gt: return *cmp > 0;
        case CompareOp::Ge: return *cmp >= 0;
        case CompareOp::Lt: return *cmp < 0;
        case CompareOp::Le: return *cmp <= 0;
        default:            return false;
    }
}

Rows FilterRows(const Rows& rows, const std::vector<Condition>& conditions) {
    if (conditions.empty()) {
        return rows;
    }
    Rows out;
    for (const auto& row : rows) {
        const bool keep = std::all_of(conditions.begin(), conditions.end(),
                                      [&row](const Condition& c) { return EvaluateCondition(row, c); });
        if (keep) out.push_back(row);
    }
    return out;
}

Rows JoinRows(const Rows& base, const JoinClause& join, const Rows& join_rows,
              std::vector<Error>* warnings) {
    const FieldRef* join_field = nullptr;
    const FieldRef* main_field = nullptr;
    if (join.right.table == join.collection) {
        join_field = &join.right;
        main_field = &join.left;
    } else if (join.left.table == join.collection) {
        join_field = &join.left;
        main_field = &join.right;
    } else {
        auto warning = Error::Make(
            ErrorCategory::JoinCondition, "JoinRows", join.collection,
            "ON " + join.left.Qualified() + " = " + join.right.Qualified() +
                " does not reference the joined collection; join skipped");
        LogWarn("executor", warning.ToString());
        if (warnings) warnings->push_back(std::move(warning));
        return base;
    }

    const std::string prefix = join.collection + ".";
    Rows out;
    out.reserve(base.size());
    for (const auto& row : base) {
        const Value* key = LookupField(row, *main_field);
        bool matched = false;
        if (key != nullptr && !key->IsNull()) {
            for (const auto& candidate : join_rows) {
                const Value* other = candidate.Find(join_field->name);
                if (other == nullptr || !ValuesEqual(*key, *other)) continue;

                Row combined = row;
                for (const auto& [name, value] : candidate) {
                    combined.Set(prefix + name, value);
                }
                out.push_back(std::move(combined));
                matched = true;
            }
        }
        if (!matched) {
            out.push_back(row);
        }
    }
    return out;
}

Rows ProjectRows(const Rows& rows, const std::vector<FieldRef>& fields) {
    if (fields.empty() || (fields.size() == 1 && fields.front().IsStar())) {
        return rows;
    }
    Rows out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        Row projected;
        for (const auto& field : fields) {
            if (const Value* v = LookupField(row, field)) {
                projected.Set(field.name, *v);
            }
        }
        out.push_back(std::move(projected));
    }
    return out;
}

void OrderRows(Rows& rows, const std::vector<OrderKey>& keys) {
    if (keys.empty()) return;
    std::stable_sort(rows.begin(), rows.end(), [&keys](const Row& a, const Row& b) {
        return CompareByKeys(a, b, keys) < 0;
    });
}

void LimitRows(Rows& rows, std::optional<size_t> limit) {
    if (limit.has_value() && rows.size() > *limit) {
        rows.resize(*limit);
    }
}

Result<Rows, Error> FederationExecutor::Execute(const ParsedQuery& query,
                                                const CollectionMap& collections,
                                                const QueryParams& params,
                                                std::vector<Error>* warnings) const {
    auto bound = BindParameters(query.where, params);
    if (bound.IsErr()) {
        return Result<Rows, Error>::Err(std::move(bound).Error());
    }

    std::set<std::string> joined;
    for (const auto& join : query.joins) {
        if (join.collection != query.from_collection) joined.insert(join.collection);
    }

    std::vector<Condition> pre_join;
    std::vector<Condition> post_join;
    for (auto& cond : std::move(bound).Value()) {
        (IsPostJoin(cond, joined) ? post_join : pre_join).push_back(std::move(cond));
    }

    if (collections.count(query.from_collection) == 0) {
        LogDebug("executor", "Collection '" + query.from_collection +
                                 "' not available; result is empty");
    }

    Rows rows = FilterRows(CollectionOrEmpty(collections, query.from_collection), pre_join);
    for (const auto& join : query.joins) {
        rows = JoinRows(rows, join, CollectionOrEmpty(collections, join.collection), warnings);
    }
    rows = FilterRows(rows, post_join);

    // ORDER BY may name a field the projection drops, so sort keys are read
    // from the projected row first and from the pre-projection row after.
    Rows projected = ProjectRows(rows, query.select_fields);
    if (!query.order_by.empty()) {
        std::vector<size_t> order(projected.size());
        std::iota(order.begin(), order.end(), 0);
        auto key_of = [&](size_t i, const FieldRef& field) {
            if (const Value* v = LookupField(projected[i], field)) return *v;
            return ReadField(rows[i], field);
        };
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            for (const auto& key : query.order_by) {
                int cmp = CompareForSort(key_of(a, key.field), key_of(b, key.field));
                if (key.direction == SortDirection::Desc) cmp = -cmp;
                if (cmp != 0) return cmp < 0;
            }
            return false;
        });
        Rows sorted;
        sorted.reserve(projected.size());
        for (size_t i : order) sorted.push_back(std::move(projected[i]));
        projected = std::move(sorted);
    }
    LimitRows(projected, query.limit);

    LogDebug("executor", "Query on '" + query.from_collection + "' produced " +
                             std::to_string(projected.size()) + " row(s)");
    return Result<Rows, Error>::Ok(std::move(projected));
}

} // namespace docfed
