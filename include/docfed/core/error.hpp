#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace docfed {

// Kind of a federation failure. Decides the exit code and the
// "category" token of structured output.
enum class ErrorCategory {
    Syntax,
    UnknownParameter,
    UnknownStrategy,
    SourceConnection,
    JoinCondition,
    MappingSynthesis,
    NotFound,
    Config,
    Timeout,
    Internal,
};

/// "syntax", "unknown_parameter", "source_connection", ...
const char* ErrorCategoryName(ErrorCategory category);

/// Process exit code for a category: 1 unreachable source, 2 missing entity,
/// 3 bad query, 4 missing parameter, 5 bad configuration, 99 internal.
int ExitCodeFor(ErrorCategory category);

// ---------------------------------------------------------------------------
// Error: the failure value carried by every Result in docfed.
//
//   operation  step that failed ("ParseQuery", "Connect", ...)
//   target     what it failed on (collection, source id, file); may be empty
//   message    one human-readable sentence
//   detail     underlying cause (library message, line/column)
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string target;
    std::string message;
    std::optional<std::string> detail;
    ErrorCategory category = ErrorCategory::Internal;

    static Error Make(ErrorCategory category,
                      std::string operation,
                      std::string target,
                      std::string message,
                      std::optional<std::string> detail = std::nullopt);

    [[nodiscard]] int ExitCode() const { return ExitCodeFor(category); }
    [[nodiscard]] std::string CategoryName() const { return ErrorCategoryName(category); }

    /// "Operation [target]: message (detail)"
    [[nodiscard]] std::string ToString() const;
    /// {"error":{"category","operation","target"?,"message","detail"?,"exit_code"}}
    [[nodiscard]] std::string ToJson() const;

    bool operator==(const Error& other) const;
    bool operator!=(const Error& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Error& error);

} // namespace docfed
