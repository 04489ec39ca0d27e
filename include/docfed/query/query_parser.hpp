#pragma once

#include <docfed/core/result.hpp>
#include <docfed/query/query_ast.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace docfed {

// ---------------------------------------------------------------------------
// ParseQuery: restricted SQL dialect to ParsedQuery.
//
//   SELECT <field>[, <field>...] | *
//   FROM <collection>
//   [[LEFT [OUTER]] JOIN <collection> ON <t>.<f> = <t>.<f>]*
//   [WHERE <field> <op> <operand> [AND ...]]
//   [ORDER BY <field> [ASC|DESC][, ...]]
//   [LIMIT <n>] [;]
//
// Keywords are case-insensitive. OR, parentheses, subqueries, aggregate
// functions, GROUP BY, HAVING, UNION and non-left joins are rejected with a
// Syntax error rather than ignored.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ParsedQuery, Error> ParseQuery(std::string_view text);

struct SyntaxCheck {
    bool valid = false;
    std::optional<std::string> error;
};

/// Parse and discard; reports the first syntax error as text.
SyntaxCheck ValidateQuerySyntax(std::string_view text);

} // namespace docfed
