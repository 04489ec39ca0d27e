#include <docfed/query/query_parser.hpp>

#include "query_lexer.hpp"

#include <docfed/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>
#include <vector>

namespace docfed {

namespace {

using query_lexer::IsKeyword;
using query_lexer::Token;
using query_lexer::TokenKind;

constexpr const char* kJoinShape =
    "JOIN clause must have the form JOIN <collection> ON "
    "<leftTable>.<leftField> = <rightTable>.<rightField>";

std::string Describe(const Token& token) {
    switch (token.kind) {
        case TokenKind::End:       return "end of query";
        case TokenKind::String:    return "string '" + token.text + "'";
        case TokenKind::Parameter: return "parameter :" + token.text;
        default:                   return "'" + token.text + "'";
    }
}

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    Result<ParsedQuery, Error> Parse() {
        ParsedQuery query;

        if (!IsKeyword(Peek(), "SELECT")) {
            return Fail(Peek(), "Query must start with SELECT");
        }
        Advance();

        if (auto r = ParseSelectList(query); r.IsErr()) {
            return Result<ParsedQuery, Error>::Err(std::move(r).Error());
        }

        if (!IsKeyword(Peek(), "FROM")) {
            if (Peek().kind == TokenKind::End) {
                return Fail(Peek(), "Query must include FROM clause");
            }
            return Unexpected(Peek(), "FROM");
        }
        Advance();

        auto from = ParseCollectionName("FROM");
        if (from.IsErr()) {
            return Result<ParsedQuery, Error>::Err(std::move(from).Error());
        }
        query.from_collection = std::move(from).Value();

        while (StartsJoin()) {
            auto join = ParseJoin();
            if (join.IsErr()) {
                return Result<ParsedQuery, Error>::Err(std::move(join).Error());
            }
            query.joins.push_back(std::move(join).Value());
        }

        if (IsKeyword(Peek(), "WHERE")) {
            Advance();
            if (auto r = ParseWhere(query); r.IsErr()) {
                return Result<ParsedQuery, Error>::Err(std::move(r).Error());
            }
        }

        if (IsKeyword(Peek(), "ORDER")) {
            Advance();
            if (!IsKeyword(Peek(), "BY")) {
                return Unexpected(Peek(), "BY after ORDER");
            }
            Advance();
            if (auto r = ParseOrderBy(query); r.IsErr()) {
                return Result<ParsedQuery, Error>::Err(std::move(r).Error());
            }
        }

        if (IsKeyword(Peek(), "LIMIT")) {
            Advance();
            const Token& tok = Peek();
            const bool is_integer =
                tok.kind == TokenKind::Number &&
                std::all_of(tok.text.begin(), tok.text.end(),
                            [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
            if (!is_integer) {
                return Fail(tok, "LIMIT requires a non-negative integer");
            }
            size_t limit = 0;
            const char* first = tok.text.data();
            const char* last = first + tok.text.size();
            const auto [end, ec] = std::from_chars(first, last, limit);
            if (ec == std::errc::result_out_of_range) {
                return Fail(tok, "LIMIT value out of range");
            }
            if (ec != std::errc() || end != last) {
                return Fail(tok, "LIMIT requires a non-negative integer");
            }
            query.limit = limit;
            Advance();
        }

        if (Peek().kind == TokenKind::Semicolon) {
            Advance();
        }
        if (Peek().kind != TokenKind::End) {
            return Unexpected(Peek(), "end of query");
        }
        return Result<ParsedQuery, Error>::Ok(std::move(query));
    }

private:
    const Token& Peek(size_t ahead = 0) const {
        const size_t index = std::min(pos_ + ahead, tokens_.size() - 1);
        return tokens_[index];
    }

    const Token& Advance() {
        const Token& tok = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) ++pos_;
        return tok;
    }

    static Error MakeError(const Token& at, const std::string& message) {
        return Error::Make(ErrorCategory::Syntax, "ParseQuery", "", message,
                           "line " + std::to_string(at.line) + ", column " +
                               std::to_string(at.column) + ", near " + Describe(at));
    }

    static Result<ParsedQuery, Error> Fail(const Token& at, const std::string& message) {
        return Result<ParsedQuery, Error>::Err(MakeError(at, message));
    }

    // Unsupported constructs get a specific message; anything else is
    // reported as "expected X".
    static Error UnexpectedError(const Token& at, const std::string& expected) {
        if (IsKeyword(at, "OR")) {
            return MakeError(at, "OR is not supported; WHERE accepts only AND-chained comparisons");
        }
        if (IsKeyword(at, "GROUP") || IsKeyword(at, "HAVING")) {
            return MakeError(at, "GROUP BY and HAVING are not supported");
        }
        if (IsKeyword(at, "UNION")) {
            return MakeError(at, "UNION is not supported");
        }
        if (IsKeyword(at, "INNER") || IsKeyword(at, "RIGHT") ||
            IsKeyword(at, "FULL") || IsKeyword(at, "CROSS")) {
            return MakeError(at, "Only left outer joins are supported (JOIN or LEFT JOIN)");
        }
        if (at.kind == TokenKind::LParen) {
            return MakeError(at, "Parentheses and subqueries are not supported");
        }
        if (IsKeyword(at, "NOT") || IsKeyword(at, "IN") || IsKeyword(at, "LIKE")) {
            return MakeError(at, "Operator " + at.text + " is not supported");
        }
        return MakeError(at, "Expected " + expected + ", found " + Describe(at));
    }

    static Result<ParsedQuery, Error> Unexpected(const Token& at, const std::string& expected) {
        return Result<ParsedQuery, Error>::Err(UnexpectedError(at, expected));
    }

    bool StartsJoin() const {
        const Token& tok = Peek();
        return IsKeyword(tok, "JOIN") || IsKeyword(tok, "LEFT") ||
               IsKeyword(tok, "INNER") || IsKeyword(tok, "RIGHT") ||
               IsKeyword(tok, "FULL") || IsKeyword(tok, "CROSS");
    }

    Result<FieldRef, Error> ParseField(const std::string& context) {
        const Token& first = Peek();
        if (first.kind != TokenKind::Identifier || query_lexer::IsKeyword(first.text)) {
            return Result<FieldRef, Error>::Err(UnexpectedError(first, context));
        }
        if (Peek(1).kind == TokenKind::LParen) {
            return Result<FieldRef, Error>::Err(MakeError(
                first, "Function calls and aggregates are not supported: " + first.text));
        }
        Advance();
        if (Peek().kind != TokenKind::Dot) {
            return Result<FieldRef, Error>::Ok(FieldRef{"", first.text});
        }
        Advance();
        const Token& second = Peek();
        if (second.kind == TokenKind::Star) {
            return Result<FieldRef, Error>::Err(
                MakeError(second, "Qualified '*' is not supported; use '*' alone"));
        }
        if (second.kind != TokenKind::Identifier) {
            return Result<FieldRef, Error>::Err(
                UnexpectedError(second, "field name after '" + first.text + ".'"));
        }
        Advance();
        return Result<FieldRef, Error>::Ok(FieldRef{first.text, second.text});
    }

    Result<std::string, Error> ParseCollectionName(const std::string& clause) {
        const Token& tok = Peek();
        if (tok.kind == TokenKind::LParen) {
            return Result<std::string, Error>::Err(
                MakeError(tok, "Subqueries are not supported in " + clause));
        }
        if (tok.kind != TokenKind::Identifier || query_lexer::IsKeyword(tok.text)) {
            return Result<std::string, Error>::Err(
                UnexpectedError(tok, "collection name after " + clause));
        }
        Advance();
        return Result<std::string, Error>::Ok(tok.text);
    }

    Result<void, Error> ParseSelectList(ParsedQuery& query) {
        if (Peek().kind == TokenKind::Star) {
            Advance();
            query.select_fields.push_back(FieldRef{"", "*"});
            return Result<void, Error>::Ok();
        }
        // Output rows are keyed by bare field name, so two fields with the
        // same name would collide.
        while (true) {
            const Token start = Peek();
            auto field = ParseField("field name in SELECT list");
            if (field.IsErr()) {
                return Result<void, Error>::Err(std::move(field).Error());
            }
            const std::string& name = field.Value().name;
            const bool duplicate = std::any_of(
                query.select_fields.begin(), query.select_fields.end(),
                [&name](const FieldRef& seen) { return seen.name == name; });
            if (duplicate) {
                return Result<void, Error>::Err(
                    MakeError(start, "Duplicate output field '" + name + "' in SELECT list"));
            }
            query.select_fields.push_back(std::move(field).Value());
            if (Peek().kind != TokenKind::Comma) {
                return Result<void, Error>::Ok();
            }
            Advance();
        }
    }

    Result<JoinClause, Error> ParseJoin() {
        const Token& start = Peek();
        if (IsKeyword(start, "LEFT")) {
            Advance();
            if (IsKeyword(Peek(), "OUTER")) Advance();
        }
        if (!IsKeyword(Peek(), "JOIN")) {
            return Result<JoinClause, Error>::Err(UnexpectedError(Peek(), "JOIN"));
        }
        Advance();

        auto collection = ParseCollectionName("JOIN");
        if (collection.IsErr()) {
            return Result<JoinClause, Error>::Err(std::move(collection).Error());
        }

        if (!IsKeyword(Peek(), "ON")) {
            return Result<JoinClause, Error>::Err(MakeError(Peek(), kJoinShape));
        }
        Advance();

        auto left = ParseField("qualified field in ON clause");
        if (left.IsErr() || !left.Value().IsQualified()) {
            return Result<JoinClause, Error>::Err(MakeError(start, kJoinShape));
        }
        if (Peek().kind != TokenKind::Operator || Peek().text != "=") {
            return Result<JoinClause, Error>::Err(MakeError(Peek(), kJoinShape));
        }
        Advance();
        auto right = ParseField("qualified field in ON clause");
        if (right.IsErr() || !right.Value().IsQualified()) {
            return Result<JoinClause, Error>::Err(MakeError(start, kJoinShape));
        }
        if (IsKeyword(Peek(), "AND") || IsKeyword(Peek(), "OR")) {
            return Result<JoinClause, Error>::Err(
                MakeError(Peek(), "JOIN ... ON accepts a single equality condition"));
        }

        return Result<JoinClause, Error>::Ok(JoinClause{
            std::move(collection).Value(), std::move(left).Value(), std::move(right).Value()});
    }

    Result<CompareOp, Error> ParseOperator() {
        const Token& tok = Peek();
        if (tok.kind != TokenKind::Operator) {
            return Result<CompareOp, Error>::Err(UnexpectedError(tok, "comparison operator"));
        }
        Advance();
        if (tok.text == "=") return Result<CompareOp, Error>::Ok(CompareOp::Eq);
        if (tok.text == "!=") return Result<CompareOp, Error>::Ok(CompareOp::Ne);
        if (tok.text == ">") return Result<CompareOp, Error>::Ok(CompareOp::Gt);
        if (tok.text == ">=") return Result<CompareOp, Error>::Ok(CompareOp::Ge);
        if (tok.text == "<") return Result<CompareOp, Error>::Ok(CompareOp::Lt);
        return Result<CompareOp, Error>::Ok(CompareOp::Le);
    }

    Result<Operand, Error> ParseOperand() {
        const Token& tok = Peek();
        switch (tok.kind) {
            case TokenKind::String:
                Advance();
                return Result<Operand, Error>::Ok(Operand{Value(tok.text)});
            case TokenKind::Number: {
                auto number = ParseNumber(tok.text);
                if (!number) {
                    return Result<Operand, Error>::Err(MakeError(tok, "Malformed number"));
                }
                Advance();
                return Result<Operand, Error>::Ok(Operand{Value(*number)});
            }
            case TokenKind::Parameter:
                Advance();
                return Result<Operand, Error>::Ok(Operand{ParamRef{tok.text}});
            case TokenKind::Identifier:
                if (IsKeyword(tok, "TRUE")) {
                    Advance();
                    return Result<Operand, Error>::Ok(Operand{Value(true)});
                }
                if (IsKeyword(tok, "FALSE")) {
                    Advance();
                    return Result<Operand, Error>::Ok(Operand{Value(false)});
                }
                if (IsKeyword(tok, "NULL")) {
                    Advance();
                    return Result<Operand, Error>::Ok(Operand{Value()});
                }
                break;
            default:
                break;
        }
        auto field = ParseField("value, :parameter or field name");
        if (field.IsErr()) {
            return Result<Operand, Error>::Err(std::move(field).Error());
        }
        return Result<Operand, Error>::Ok(Operand{std::move(field).Value()});
    }

    Result<void, Error> ParseWhere(ParsedQuery& query) {
        while (true) {
            if (Peek().kind == TokenKind::LParen) {
                return Result<void, Error>::Err(UnexpectedError(Peek(), "condition"));
            }
            auto field = ParseField("field name in WHERE");
            if (field.IsErr()) {
                return Result<void, Error>::Err(std::move(field).Error());
            }
            auto op = ParseOperator();
            if (op.IsErr()) {
                return Result<void, Error>::Err(std::move(op).Error());
            }
            auto operand = ParseOperand();
            if (operand.IsErr()) {
                return Result<void, Error>::Err(std::move(operand).Error());
            }
            query.where.push_back(Condition{std::move(field).Value(), op.Value(),
                                            std::move(operand).Value()});
            if (!IsKeyword(Peek(), "AND")) {
                if (IsKeyword(Peek(), "OR")) {
                    return Result<void, Error>::Err(UnexpectedError(Peek(), "AND"));
                }
                return Result<void, Error>::Ok();
            }
            Advance();
        }
    }

    Result<void, Error> ParseOrderBy(ParsedQuery& query) {
        while (true) {
            auto field = ParseField("field name in ORDER BY");
            if (field.IsErr()) {
                return Result<void, Error>::Err(std::move(field).Error());
            }
            OrderKey key{std::move(field).Value(), SortDirection::Asc};
            if (IsKeyword(Peek(), "ASC")) {
                Advance();
            } else if (IsKeyword(Peek(), "DESC")) {
                Advance();
                key.direction = SortDirection::Desc;
            }
            query.order_by.push_back(std::move(key));
            if (Peek().kind != TokenKind::Comma) {
                return Result<void, Error>::Ok();
            }
            Advance();
        }
    }

    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

} // anonymous namespace

Result<ParsedQuery, Error> ParseQuery(std::string_view text) {
    auto tokens = query_lexer::Tokenize(text);
    if (tokens.IsErr()) {
        return Result<ParsedQuery, Error>::Err(std::move(tokens).Error());
    }
    auto parsed = Parser(std::move(tokens).Value()).Parse();
    if (parsed.IsErr()) {
        LogDebug("parser", parsed.Error().ToString());
    }
    return parsed;
}

SyntaxCheck ValidateQuerySyntax(std::string_view text) {
    auto parsed = ParseQuery(text);
    if (parsed.IsOk()) {
        return SyntaxCheck{true, std::nullopt};
    }
    return SyntaxCheck{false, parsed.Error().ToString()};
}

} // namespace docfed
