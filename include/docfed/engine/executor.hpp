#pragma once

#include <docfed/core/result.hpp>
#include <docfed/core/row.hpp>
#include <docfed/query/query_ast.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace docfed {

// Caller-supplied bindings for `:name` placeholders.
using QueryParams = std::map<std::string, Value>;

// ---------------------------------------------------------------------------
// FederationExecutor: runs a ParsedQuery over already-fetched collections.
//
// Stages, in order: resolve FROM rows, filter, left-outer join, filter on
// joined fields, project, order, limit. The executor holds no state and is
// safe to share between threads.
// ---------------------------------------------------------------------------
class FederationExecutor {
public:
    /// Execute `query` over `collections`. Fails with UnknownParameter when a
    /// `:param` has no binding. Skipped joins are reported in `warnings`.
    [[nodiscard]] Result<Rows, Error> Execute(const ParsedQuery& query,
                                              const CollectionMap& collections,
                                              const QueryParams& params,
                                              std::vector<Error>* warnings = nullptr) const;
};

// ---------------------------------------------------------------------------
// Stage functions. Exposed for testing and reuse.
// ---------------------------------------------------------------------------

/// Value of `field` on `row`: "table.name" first, then the bare name. An
/// unqualified name not present on the row matches a joined "<collection>.<name>".
const Value* LookupField(const Row& row, const FieldRef& field);

/// Replace every ParamRef operand with its bound value.
Result<std::vector<Condition>, Error> BindParameters(const std::vector<Condition>& conditions,
                                                     const QueryParams& params);

/// True if the comparison holds on `row`. A missing field reads as null.
/// Conditions must be bound first; an unbound ParamRef never holds.
bool EvaluateCondition(const Row& row, const Condition& condition);

/// Rows for which every condition holds.
Rows FilterRows(const Rows& rows, const std::vector<Condition>& conditions);

/// Left-outer nested-loop join. Join-side fields land on the combined row as
/// "<collection>.<field>". Returns `base` unchanged with a JoinCondition
/// warning when the ON clause does not reference the joined collection.
Rows JoinRows(const Rows& base, const JoinClause& join, const Rows& join_rows,
              std::vector<Error>* warnings = nullptr);

/// Keep the selected fields under their bare names. `*` keeps everything.
Rows ProjectRows(const Rows& rows, const std::vector<FieldRef>& fields);

/// Stable multi-key sort. Missing and null values sort first ascending.
void OrderRows(Rows& rows, const std::vector<OrderKey>& keys);

void LimitRows(Rows& rows, std::optional<size_t> limit);

} // namespace docfed
