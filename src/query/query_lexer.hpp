#pragma once

#include <docfed/core/result.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docfed::query_lexer {

enum class TokenKind {
    Identifier,  // also keywords; the parser matches them case-insensitively
    String,      // quoted literal, quotes removed and '' / "" unescaped
    Number,
    Parameter,   // `:name`, text holds the name
    Star,
    Comma,
    Dot,
    LParen,
    RParen,
    Semicolon,
    Operator,    // = != <> < <= > >=
    End,
};

struct Token {
    TokenKind kind = TokenKind::End;
    std::string text;
    size_t offset = 0;  // byte offset into the query text
    size_t line = 1;
    size_t column = 1;
};

/// Split query text into tokens. Fails with a Syntax error on an
/// unterminated string literal or a character outside the dialect.
Result<std::vector<Token>, Error> Tokenize(std::string_view text);

/// True if the identifier is a reserved word of the dialect (any case).
bool IsKeyword(std::string_view word);

/// Case-insensitive keyword comparison; `keyword` must be upper-case.
bool IsKeyword(const Token& token, std::string_view keyword);

} // namespace docfed::query_lexer
