#include <docfed/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace docfed {

Result<FederationStrategy, Error> ParseFederationStrategy(std::string_view token) {
    if (token == "virtual") {
        return Result<FederationStrategy, Error>::Ok(FederationStrategy::Virtual);
    }
    if (token == "materialized") {
        return Result<FederationStrategy, Error>::Ok(FederationStrategy::Materialized);
    }
    if (token == "hybrid") {
        return Result<FederationStrategy, Error>::Ok(FederationStrategy::Hybrid);
    }
    return Result<FederationStrategy, Error>::Err(Error::Make(
        ErrorCategory::UnknownStrategy, "ParseFederationStrategy", std::string(token),
        "Unknown federation strategy, expected one of: virtual, materialized, hybrid"));
}

const char* FederationStrategyName(FederationStrategy strategy) {
    switch (strategy) {
        case FederationStrategy::Virtual:      return "virtual";
        case FederationStrategy::Materialized: return "materialized";
        case FederationStrategy::Hybrid:       return "hybrid";
    }
    return "virtual";
}

const char* SourceStatusName(SourceStatus status) {
    switch (status) {
        case SourceStatus::Disconnected: return "disconnected";
        case SourceStatus::Connected:    return "connected";
        case SourceStatus::Error:        return "error";
    }
    return "error";
}

// ---------------------------------------------------------------------------
// CollectionName
// ---------------------------------------------------------------------------
Result<CollectionName, std::string> CollectionName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<CollectionName, std::string>::Err(
            "Collection name must not be empty");
    }
    if (name.size() > 128) {
        return Result<CollectionName, std::string>::Err(
            "Collection name must be at most 128 characters, got " +
            std::to_string(name.size()));
    }
    if (std::isdigit(static_cast<unsigned char>(name[0]))) {
        return Result<CollectionName, std::string>::Err(
            "Collection name must not start with a digit");
    }
    const bool valid = std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
    if (!valid) {
        return Result<CollectionName, std::string>::Err(
            "Collection name must contain only letters, digits, '_' and '-'");
    }
    return Result<CollectionName, std::string>::Ok(CollectionName(std::string(name)));
}

} // namespace docfed
