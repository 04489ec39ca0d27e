#include <docfed/core/error.hpp>

#include <nlohmann/json.hpp>

#include <tuple>

namespace docfed {

const char* ErrorCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Syntax:           return "syntax";
        case ErrorCategory::UnknownParameter: return "unknown_parameter";
        case ErrorCategory::UnknownStrategy:  return "unknown_strategy";
        case ErrorCategory::SourceConnection: return "source_connection";
        case ErrorCategory::JoinCondition:    return "join_condition";
        case ErrorCategory::MappingSynthesis: return "mapping_synthesis";
        case ErrorCategory::NotFound:         return "not_found";
        case ErrorCategory::Config:           return "config";
        case ErrorCategory::Timeout:          return "timeout";
        case ErrorCategory::Internal:         return "internal";
    }
    return "internal";
}

int ExitCodeFor(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::SourceConnection:
        case ErrorCategory::Timeout:
            return 1;
        case ErrorCategory::NotFound:
            return 2;
        case ErrorCategory::Syntax:
        case ErrorCategory::JoinCondition:
            return 3;
        case ErrorCategory::UnknownParameter:
            return 4;
        case ErrorCategory::UnknownStrategy:
        case ErrorCategory::Config:
            return 5;
        case ErrorCategory::MappingSynthesis:
        case ErrorCategory::Internal:
            return 99;
    }
    return 99;
}

Error Error::Make(ErrorCategory category,
                  std::string operation,
                  std::string target,
                  std::string message,
                  std::optional<std::string> detail) {
    Error error;
    error.category = category;
    error.operation = std::move(operation);
    error.target = std::move(target);
    error.message = std::move(message);
    if (detail && !detail->empty()) error.detail = std::move(detail);
    return error;
}

std::string Error::ToString() const {
    std::string text = operation;
    if (!target.empty()) text += " [" + target + "]";
    text += ": " + message;
    if (detail && !detail->empty()) text += " (" + *detail + ")";
    return text;
}

std::string Error::ToJson() const {
    nlohmann::ordered_json body;
    body["category"] = CategoryName();
    body["operation"] = operation;
    if (!target.empty()) body["target"] = target;
    body["message"] = message;
    if (detail && !detail->empty()) body["detail"] = *detail;
    body["exit_code"] = ExitCode();

    nlohmann::ordered_json wrapper;
    wrapper["error"] = std::move(body);
    return wrapper.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

bool Error::operator==(const Error& other) const {
    return std::tie(category, operation, target, message, detail) ==
           std::tie(other.category, other.operation, other.target, other.message, other.detail);
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.ToString();
}

} // namespace docfed
