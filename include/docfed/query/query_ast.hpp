#pragma once

#include <docfed/core/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace docfed {

// ---------------------------------------------------------------------------
// FieldRef: `name` or `table.name`. A select list of `*` is a single
// FieldRef with name "*".
// ---------------------------------------------------------------------------
struct FieldRef {
    std::string table;  // empty when unqualified
    std::string name;

    [[nodiscard]] bool IsQualified() const noexcept { return !table.empty(); }
    [[nodiscard]] bool IsStar() const noexcept { return table.empty() && name == "*"; }

    /// "table.name" or "name".
    [[nodiscard]] std::string Qualified() const {
        return table.empty() ? name : table + "." + name;
    }

    bool operator==(const FieldRef& other) const {
        return table == other.table && name == other.name;
    }
    bool operator!=(const FieldRef& other) const { return !(*this == other); }
};

enum class CompareOp {
    Eq,
    Ne,
    Gt,
    Ge,
    Lt,
    Le,
};

const char* CompareOpSymbol(CompareOp op);

// `:name` placeholder, bound from the caller's parameter map at execution.
struct ParamRef {
    std::string name;

    bool operator==(const ParamRef& other) const { return name == other.name; }
};

// Right-hand side of a comparison: a literal, a parameter, or another field
// of the same row.
using Operand = std::variant<Value, ParamRef, FieldRef>;

struct Condition {
    FieldRef field;
    CompareOp op = CompareOp::Eq;
    Operand operand;

    bool operator==(const Condition& other) const {
        return field == other.field && op == other.op && operand == other.operand;
    }
};

// `JOIN <collection> ON <left> = <right>`. Which side belongs to the joined
// collection is resolved at execution.
struct JoinClause {
    std::string collection;
    FieldRef left;
    FieldRef right;

    bool operator==(const JoinClause& other) const {
        return collection == other.collection && left == other.left &&
               right == other.right;
    }
};

enum class SortDirection {
    Asc,
    Desc,
};

struct OrderKey {
    FieldRef field;
    SortDirection direction = SortDirection::Asc;

    bool operator==(const OrderKey& other) const {
        return field == other.field && direction == other.direction;
    }
};

// ---------------------------------------------------------------------------
// ParsedQuery: the AST of one query. Rebuilt per execution.
// ---------------------------------------------------------------------------
struct ParsedQuery {
    std::vector<FieldRef> select_fields;
    std::string from_collection;
    std::vector<JoinClause> joins;
    std::vector<Condition> where;
    std::vector<OrderKey> order_by;
    std::optional<size_t> limit;

    [[nodiscard]] bool SelectsAll() const {
        return select_fields.size() == 1 && select_fields.front().IsStar();
    }

    /// FROM collection followed by joined collections, without duplicates.
    [[nodiscard]] std::vector<std::string> ReferencedCollections() const;

    /// Names of all `:param` references, in order of first appearance.
    [[nodiscard]] std::vector<std::string> ParameterNames() const;

    bool operator==(const ParsedQuery& other) const {
        return select_fields == other.select_fields &&
               from_collection == other.from_collection &&
               joins == other.joins && where == other.where &&
               order_by == other.order_by && limit == other.limit;
    }
    bool operator!=(const ParsedQuery& other) const { return !(*this == other); }
};

/// Canonical query text. Keywords upper-case, single spaces, string literals
/// single-quoted. Parsing the result yields an equal ParsedQuery.
std::string ToQueryText(const ParsedQuery& query);

} // namespace docfed
