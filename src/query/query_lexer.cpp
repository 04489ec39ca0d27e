#include "query_lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace docfed::query_lexer {

namespace {

constexpr std::array<std::string_view, 25> kKeywords = {
    "SELECT", "FROM",  "JOIN",  "LEFT",   "OUTER",  "INNER", "RIGHT", "FULL",
    "CROSS",  "ON",    "WHERE", "AND",    "OR",     "NOT",   "ORDER", "BY",
    "ASC",    "DESC",  "LIMIT", "GROUP",  "HAVING", "UNION", "TRUE",  "FALSE",
    "NULL",
};

bool IsIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool IsIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' ||
           c == '-';
}

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool EqualsUpper(std::string_view word, std::string_view upper) {
    if (word.size() != upper.size()) return false;
    for (size_t i = 0; i < word.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(word[i])) != upper[i]) {
            return false;
        }
    }
    return true;
}

class Scanner {
public:
    explicit Scanner(std::string_view text) : text_(text) {}

    Result<std::vector<Token>, Error> Run() {
        std::vector<Token> tokens;
        while (true) {
            SkipWhitespaceAndComments();
            if (pos_ >= text_.size()) {
                tokens.push_back(Make(TokenKind::End, ""));
                return Result<std::vector<Token>, Error>::Ok(std::move(tokens));
            }
            auto token = Next();
            if (token.IsErr()) {
                return Result<std::vector<Token>, Error>::Err(std::move(token).Error());
            }
            tokens.push_back(std::move(token).Value());
        }
    }

private:
    Token Make(TokenKind kind, std::string text) const {
        return Token{kind, std::move(text), start_, start_line_, start_column_};
    }

    Error MakeError(const std::string& message) const {
        return Error::Make(ErrorCategory::Syntax, "Tokenize", "", message,
                           "line " + std::to_string(start_line_) + ", column " +
                               std::to_string(start_column_));
    }

    void Advance() {
        if (text_[pos_] == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        ++pos_;
    }

    void SkipWhitespaceAndComments() {
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (std::isspace(static_cast<unsigned char>(c))) {
                Advance();
            } else if (c == '-' && pos_ + 1 < text_.size() && text_[pos_ + 1] == '-') {
                // -- line comment
                while (pos_ < text_.size() && text_[pos_] != '\n') Advance();
            } else {
                break;
            }
        }
    }

    Result<Token, Error> Next() {
        start_ = pos_;
        start_line_ = line_;
        start_column_ = column_;
        const char c = text_[pos_];

        if (IsIdentStart(c)) {
            while (pos_ < text_.size() && IsIdentChar(text_[pos_])) Advance();
            return Result<Token, Error>::Ok(
                Make(TokenKind::Identifier, std::string(text_.substr(start_, pos_ - start_))));
        }

        if (IsDigit(c) || (c == '-' && pos_ + 1 < text_.size() && IsDigit(text_[pos_ + 1]))) {
            return ScanNumber();
        }

        if (c == '\'' || c == '"') {
            return ScanString(c);
        }

        if (c == ':') {
            Advance();
            const size_t name_start = pos_;
            while (pos_ < text_.size() && IsIdentChar(text_[pos_])) Advance();
            if (pos_ == name_start) {
                return Result<Token, Error>::Err(MakeError("Expected parameter name after ':'"));
            }
            return Result<Token, Error>::Ok(Make(
                TokenKind::Parameter, std::string(text_.substr(name_start, pos_ - name_start))));
        }

        switch (c) {
            case '*': Advance(); return Result<Token, Error>::Ok(Make(TokenKind::Star, "*"));
            case ',': Advance(); return Result<Token, Error>::Ok(Make(TokenKind::Comma, ","));
            case '.': Advance(); return Result<Token, Error>::Ok(Make(TokenKind::Dot, "."));
            case '(': Advance(); return Result<Token, Error>::Ok(Make(TokenKind::LParen, "("));
            case ')': Advance(); return Result<Token, Error>::Ok(Make(TokenKind::RParen, ")"));
            case ';': Advance(); return Result<Token, Error>::Ok(Make(TokenKind::Semicolon, ";"));
            case '=':
                Advance();
                if (pos_ < text_.size() && text_[pos_] == '=') Advance();  // tolerate ==
                return Result<Token, Error>::Ok(Make(TokenKind::Operator, "="));
            case '!':
                Advance();
                if (pos_ < text_.size() && text_[pos_] == '=') {
                    Advance();
                    return Result<Token, Error>::Ok(Make(TokenKind::Operator, "!="));
                }
                return Result<Token, Error>::Err(MakeError("Unexpected character '!'"));
            case '<':
                Advance();
                if (pos_ < text_.size() && text_[pos_] == '=') {
                    Advance();
                    return Result<Token, Error>::Ok(Make(TokenKind::Operator, "<="));
                }
                if (pos_ < text_.size() && text_[pos_] == '>') {
                    Advance();
                    return Result<Token, Error>::Ok(Make(TokenKind::Operator, "!="));
                }
                return Result<Token, Error>::Ok(Make(TokenKind::Operator, "<"));
            case '>':
                Advance();
                if (pos_ < text_.size() && text_[pos_] == '=') {
                    Advance();
                    return Result<Token, Error>::Ok(Make(TokenKind::Operator, ">="));
                }
                return Result<Token, Error>::Ok(Make(TokenKind::Operator, ">"));
            default:
                break;
        }
        return Result<Token, Error>::Err(
            MakeError(std::string("Unexpected character '") + c + "'"));
    }

    Result<Token, Error> ScanNumber() {
        if (text_[pos_] == '-') Advance();
        while (pos_ < text_.size() && IsDigit(text_[pos_])) Advance();
        if (pos_ + 1 < text_.size() && text_[pos_] == '.' && IsDigit(text_[pos_ + 1])) {
            Advance();
            while (pos_ < text_.size() && IsDigit(text_[pos_])) Advance();
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            size_t look = pos_ + 1;
            if (look < text_.size() && (text_[look] == '+' || text_[look] == '-')) ++look;
            if (look < text_.size() && IsDigit(text_[look])) {
                while (pos_ < look) Advance();
                while (pos_ < text_.size() && IsDigit(text_[pos_])) Advance();
            }
        }
        if (pos_ < text_.size() && IsIdentStart(text_[pos_])) {
            return Result<Token, Error>::Err(MakeError("Malformed number"));
        }
        return Result<Token, Error>::Ok(
            Make(TokenKind::Number, std::string(text_.substr(start_, pos_ - start_))));
    }

    Result<Token, Error> ScanString(char quote) {
        Advance();
        std::string value;
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c == quote) {
                // A doubled quote is an escaped quote.
                if (pos_ + 1 < text_.size() && text_[pos_ + 1] == quote) {
                    value += quote;
                    Advance();
                    Advance();
                    continue;
                }
                Advance();
                return Result<Token, Error>::Ok(Make(TokenKind::String, std::move(value)));
            }
            value += c;
            Advance();
        }
        return Result<Token, Error>::Err(MakeError("Unterminated string literal"));
    }

    std::string_view text_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t start_ = 0;
    size_t start_line_ = 1;
    size_t start_column_ = 1;
};

} // anonymous namespace

Result<std::vector<Token>, Error> Tokenize(std::string_view text) {
    return Scanner(text).Run();
}

bool IsKeyword(std::string_view word) {
    return std::any_of(kKeywords.begin(), kKeywords.end(),
                       [word](std::string_view kw) { return EqualsUpper(word, kw); });
}

bool IsKeyword(const Token& token, std::string_view keyword) {
    return token.kind == TokenKind::Identifier && EqualsUpper(token.text, keyword);
}

} // namespace docfed::query_lexer
