#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace docfed {

// Documents keep their field order end to end.
using Json = nlohmann::ordered_json;

// ---------------------------------------------------------------------------
// Timestamp: UTC instant with millisecond precision.
// ---------------------------------------------------------------------------
struct Timestamp {
    int64_t millis = 0;  // since the Unix epoch

    bool operator==(const Timestamp& other) const { return millis == other.millis; }
    bool operator!=(const Timestamp& other) const { return millis != other.millis; }
    bool operator<(const Timestamp& other) const { return millis < other.millis; }
};

/// Format as ISO-8601 UTC, e.g. "2023-05-15T00:00:00.000Z".
std::string FormatTimestamp(Timestamp ts);

/// Parse "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS", optional ".fff" and optional
/// trailing "Z". Offsets other than Z are not accepted.
std::optional<Timestamp> ParseTimestamp(std::string_view text);

enum class ValueKind {
    Null,
    Bool,
    Number,
    String,
    Timestamp,
    Nested,
};

/// "null", "boolean", "number", "string", "timestamp", "object"/"array".
const char* ValueKindName(ValueKind kind);

// ---------------------------------------------------------------------------
// Value: a document field value. Objects and arrays are kept as opaque
// nested JSON; everything the engine compares on is a scalar.
// ---------------------------------------------------------------------------
class Value {
public:
    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data_(std::in_place_index<1>, b) {}
    Value(int n) : data_(std::in_place_index<2>, static_cast<double>(n)) {}
    Value(int64_t n) : data_(std::in_place_index<2>, static_cast<double>(n)) {}
    Value(double n) : data_(std::in_place_index<2>, n) {}
    Value(const char* s) : data_(std::in_place_index<3>, s) {}
    Value(std::string s) : data_(std::in_place_index<3>, std::move(s)) {}
    Value(Timestamp ts) : data_(std::in_place_index<4>, ts) {}

    static Value Nested(Json json);

    [[nodiscard]] ValueKind Kind() const noexcept {
        return static_cast<ValueKind>(data_.index());
    }

    [[nodiscard]] bool IsNull() const noexcept { return Kind() == ValueKind::Null; }
    [[nodiscard]] bool IsBool() const noexcept { return Kind() == ValueKind::Bool; }
    [[nodiscard]] bool IsNumber() const noexcept { return Kind() == ValueKind::Number; }
    [[nodiscard]] bool IsString() const noexcept { return Kind() == ValueKind::String; }
    [[nodiscard]] bool IsTimestamp() const noexcept { return Kind() == ValueKind::Timestamp; }
    [[nodiscard]] bool IsNested() const noexcept { return Kind() == ValueKind::Nested; }

    [[nodiscard]] bool AsBool() const { return std::get<bool>(data_); }
    [[nodiscard]] double AsNumber() const { return std::get<double>(data_); }
    [[nodiscard]] const std::string& AsString() const { return std::get<std::string>(data_); }
    [[nodiscard]] Timestamp AsTimestamp() const { return std::get<Timestamp>(data_); }
    [[nodiscard]] const Json& AsNested() const { return std::get<Json>(data_); }

    /// Type name as reported in inferred schemas.
    [[nodiscard]] std::string TypeName() const;

    /// Text for tables and string transforms: strings unquoted, numbers
    /// without trailing zeros, timestamps ISO-8601, nested values as JSON.
    [[nodiscard]] std::string ToDisplayString() const;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, double, std::string, Timestamp, Json> data_;
};

/// Convert a parsed JSON value into a Value. Objects and arrays become Nested.
Value ValueFromJson(const Json& json);

/// Convert a Value to JSON. Timestamps serialize as ISO-8601 strings.
Json ValueToJson(const Value& value);

/// Try to read a string as a number (full-string match, surrounding spaces
/// allowed). Returns nullopt for "", "abc", "1x".
std::optional<double> ParseNumber(std::string_view text);

/// Equality as used by WHERE and JOIN: same-kind values compare directly;
/// a number and a numeric string compare numerically, a timestamp and an
/// ISO date string compare as instants; other mixes are unequal.
bool ValuesEqual(const Value& a, const Value& b);

/// Ordering for WHERE comparisons: <0, 0, >0, or nullopt when the two values
/// are not comparable (nulls, nested values, unrelated kinds).
std::optional<int> CompareValues(const Value& a, const Value& b);

/// Total ordering for ORDER BY: null < bool < number < string < timestamp
/// < nested, then natural order within a kind.
int CompareForSort(const Value& a, const Value& b);

} // namespace docfed
