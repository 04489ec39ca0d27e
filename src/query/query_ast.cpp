#include <docfed/query/query_ast.hpp>

#include <algorithm>
#include <sstream>

namespace docfed {

namespace {

std::string QuoteString(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

std::string LiteralText(const Value& value) {
    switch (value.Kind()) {
        case ValueKind::Null:      return "NULL";
        case ValueKind::Bool:      return value.AsBool() ? "TRUE" : "FALSE";
        case ValueKind::Number:    return value.ToDisplayString();
        case ValueKind::String:    return QuoteString(value.AsString());
        case ValueKind::Timestamp: return QuoteString(value.ToDisplayString());
        case ValueKind::Nested:    return QuoteString(value.ToDisplayString());
    }
    return "NULL";
}

struct OperandText {
    std::string operator()(const Value& v) const { return LiteralText(v); }
    std::string operator()(const ParamRef& p) const { return ":" + p.name; }
    std::string operator()(const FieldRef& f) const { return f.Qualified(); }
};

} // anonymous namespace

const char* CompareOpSymbol(CompareOp op) {
    switch (op) {
        case CompareOp::Eq: return "=";
        case CompareOp::Ne: return "!=";
        case CompareOp::Gt: return ">";
        case CompareOp::Ge: return ">=";
        case CompareOp::Lt: return "<";
        case CompareOp::Le: return "<=";
    }
    return "=";
}

std::vector<std::string> ParsedQuery::ReferencedCollections() const {
    std::vector<std::string> out;
    if (!from_collection.empty()) {
        out.push_back(from_collection);
    }
    for (const auto& join : joins) {
        if (std::find(out.begin(), out.end(), join.collection) == out.end()) {
            out.push_back(join.collection);
        }
    }
    return out;
}

std::vector<std::string> ParsedQuery::ParameterNames() const {
    std::vector<std::string> out;
    for (const auto& cond : where) {
        if (const auto* param = std::get_if<ParamRef>(&cond.operand)) {
            if (std::find(out.begin(), out.end(), param->name) == out.end()) {
                out.push_back(param->name);
            }
        }
    }
    return out;
}

std::string ToQueryText(const ParsedQuery& query) {
    std::ostringstream oss;
    oss << "SELECT ";
    for (size_t i = 0; i < query.select_fields.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << query.select_fields[i].Qualified();
    }
    oss << " FROM " << query.from_collection;

    for (const auto& join : query.joins) {
        oss << " JOIN " << join.collection << " ON " << join.left.Qualified()
            << " = " << join.right.Qualified();
    }

    for (size_t i = 0; i < query.where.size(); ++i) {
        const auto& cond = query.where[i];
        oss << (i == 0 ? " WHERE " : " AND ") << cond.field.Qualified() << ' '
            << CompareOpSymbol(cond.op) << ' ' << std::visit(OperandText{}, cond.operand);
    }

    for (size_t i = 0; i < query.order_by.size(); ++i) {
        const auto& key = query.order_by[i];
        oss << (i == 0 ? " ORDER BY " : ", ") << key.field.Qualified()
            << (key.direction == SortDirection::Desc ? " DESC" : " ASC");
    }

    if (query.limit.has_value()) {
        oss << " LIMIT " << *query.limit;
    }
    return oss.str();
}

} // namespace docfed
