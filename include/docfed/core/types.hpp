#pragma once

#include <docfed/core/result.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace docfed {

using SourceId = int64_t;
using MappingId = int64_t;
using QueryId = int64_t;

// ---------------------------------------------------------------------------
// FederationStrategy: how often a federated query re-executes against the
// live sources.
// ---------------------------------------------------------------------------
enum class FederationStrategy {
    Virtual,       // always re-run
    Materialized,  // cache for a refresh interval
    Hybrid,        // serve cache, refresh in the background
};

/// Accepts exactly "virtual", "materialized" or "hybrid".
Result<FederationStrategy, Error> ParseFederationStrategy(std::string_view token);

const char* FederationStrategyName(FederationStrategy strategy);

// ---------------------------------------------------------------------------
// SourceStatus: connection state of a registered data source.
// ---------------------------------------------------------------------------
enum class SourceStatus {
    Disconnected,
    Connected,
    Error,
};

const char* SourceStatusName(SourceStatus status);

// ---------------------------------------------------------------------------
// CollectionName: validated collection identifier.
//
// Rules:
//   - Non-empty, max 128 characters
//   - ASCII letters, digits, '_' and '-'
//   - Must not start with a digit
// ---------------------------------------------------------------------------
class CollectionName {
public:
    static Result<CollectionName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const CollectionName& other) const { return value_ == other.value_; }
    bool operator!=(const CollectionName& other) const { return value_ != other.value_; }
    bool operator<(const CollectionName& other) const { return value_ < other.value_; }

    CollectionName(const CollectionName&) = default;
    CollectionName& operator=(const CollectionName&) = default;
    CollectionName(CollectionName&&) noexcept = default;
    CollectionName& operator=(CollectionName&&) noexcept = default;

private:
    explicit CollectionName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// CollectionRef: a collection on a specific data source.
// ---------------------------------------------------------------------------
struct CollectionRef {
    SourceId source_id = 0;
    std::string collection;

    bool operator==(const CollectionRef& other) const {
        return source_id == other.source_id && collection == other.collection;
    }
    bool operator<(const CollectionRef& other) const {
        if (source_id != other.source_id) return source_id < other.source_id;
        return collection < other.collection;
    }
};

} // namespace docfed

namespace std {

template <>
struct hash<docfed::CollectionName> {
    size_t operator()(const docfed::CollectionName& n) const noexcept {
        return hash<string>{}(n.Value());
    }
};

} // namespace std
