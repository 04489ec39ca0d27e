#include <docfed/core/value.hpp>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace docfed {

namespace {

bool ReadDigits(std::string_view text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

std::string FormatNumber(double n) {
    if (std::isfinite(n) && n == std::floor(n) && std::fabs(n) < 1e15) {
        return std::to_string(static_cast<int64_t>(n));
    }
    std::ostringstream oss;
    oss << std::setprecision(15) << n;
    return oss.str();
}

int Sign(double d) {
    if (d < 0) return -1;
    if (d > 0) return 1;
    return 0;
}

} // anonymous namespace

std::string FormatTimestamp(Timestamp ts) {
    int64_t seconds = ts.millis / 1000;
    int64_t ms = ts.millis % 1000;
    if (ms < 0) {
        ms += 1000;
        seconds -= 1;
    }
    auto t = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

std::optional<Timestamp> ParseTimestamp(std::string_view text) {
    // YYYY-MM-DD
    std::tm tm{};
    int year = 0, month = 0, day = 0;
    if (text.size() < 10 || !ReadDigits(text, 0, 4, year) || text[4] != '-' ||
        !ReadDigits(text, 5, 2, month) || text[7] != '-' ||
        !ReadDigits(text, 8, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;

    int hour = 0, minute = 0, second = 0, millis = 0;
    size_t pos = 10;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        if (!ReadDigits(text, pos + 1, 2, hour) || text.size() < pos + 9 ||
            text[pos + 3] != ':' || !ReadDigits(text, pos + 4, 2, minute) ||
            text[pos + 6] != ':' || !ReadDigits(text, pos + 7, 2, second)) {
            return std::nullopt;
        }
        pos += 9;
        if (pos < text.size() && text[pos] == '.') {
            size_t start = ++pos;
            int scale = 100;
            while (pos < text.size() &&
                   std::isdigit(static_cast<unsigned char>(text[pos]))) {
                millis += (text[pos] - '0') * scale;
                scale /= 10;
                ++pos;
            }
            if (pos == start) return std::nullopt;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') ++pos;
    if (pos != text.size()) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const auto seconds = static_cast<int64_t>(timegm(&tm));
    return Timestamp{seconds * 1000 + millis};
}

const char* ValueKindName(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null:      return "null";
        case ValueKind::Bool:      return "boolean";
        case ValueKind::Number:    return "number";
        case ValueKind::String:    return "string";
        case ValueKind::Timestamp: return "timestamp";
        case ValueKind::Nested:    return "object";
    }
    return "null";
}

Value Value::Nested(Json json) {
    Value v;
    v.data_.emplace<5>(std::move(json));
    return v;
}

std::string Value::TypeName() const {
    if (IsNested()) {
        return AsNested().is_array() ? "array" : "object";
    }
    return ValueKindName(Kind());
}

std::string Value::ToDisplayString() const {
    switch (Kind()) {
        case ValueKind::Null:      return "null";
        case ValueKind::Bool:      return AsBool() ? "true" : "false";
        case ValueKind::Number:    return FormatNumber(AsNumber());
        case ValueKind::String:    return AsString();
        case ValueKind::Timestamp: return FormatTimestamp(AsTimestamp());
        case ValueKind::Nested:    return AsNested().dump();
    }
    return "";
}

Value ValueFromJson(const Json& json) {
    switch (json.type()) {
        case Json::value_t::null:
        case Json::value_t::discarded:
            return Value();
        case Json::value_t::boolean:
            return Value(json.get<bool>());
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
        case Json::value_t::number_float:
            return Value(json.get<double>());
        case Json::value_t::string:
            return Value(json.get<std::string>());
        case Json::value_t::object:
        case Json::value_t::array:
        case Json::value_t::binary:
            return Value::Nested(json);
    }
    return Value();
}

Json ValueToJson(const Value& value) {
    switch (value.Kind()) {
        case ValueKind::Null:      return nullptr;
        case ValueKind::Bool:      return value.AsBool();
        case ValueKind::Number: {
            const double n = value.AsNumber();
            if (std::isfinite(n) && n == std::floor(n) && std::fabs(n) < 9e15) {
                return static_cast<int64_t>(n);
            }
            return n;
        }
        case ValueKind::String:    return value.AsString();
        case ValueKind::Timestamp: return FormatTimestamp(value.AsTimestamp());
        case ValueKind::Nested:
            return value.AsNested();
    }
    return nullptr;
}

std::optional<double> ParseNumber(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (begin == end) return std::nullopt;

    const std::string trimmed(text.substr(begin, end - begin));
    char* parse_end = nullptr;
    const double value = std::strtod(trimmed.c_str(), &parse_end);
    if (parse_end != trimmed.c_str() + trimmed.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

bool ValuesEqual(const Value& a, const Value& b) {
    if (a.Kind() == b.Kind()) {
        return a == b;
    }
    auto c = CompareValues(a, b);
    return c.has_value() && *c == 0;
}

std::optional<int> CompareValues(const Value& a, const Value& b) {
    if (a.Kind() == b.Kind()) {
        switch (a.Kind()) {
            case ValueKind::Null:
            case ValueKind::Nested:
                return std::nullopt;
            case ValueKind::Bool:
                return static_cast<int>(a.AsBool()) - static_cast<int>(b.AsBool());
            case ValueKind::Number:
                return Sign(a.AsNumber() - b.AsNumber());
            case ValueKind::String: {
                const int c = a.AsString().compare(b.AsString());
                return c < 0 ? -1 : (c > 0 ? 1 : 0);
            }
            case ValueKind::Timestamp: {
                const auto d = a.AsTimestamp().millis - b.AsTimestamp().millis;
                return d < 0 ? -1 : (d > 0 ? 1 : 0);
            }
        }
        return std::nullopt;
    }
    if (a.IsNumber() && b.IsString()) {
        auto n = ParseNumber(b.AsString());
        if (!n) return std::nullopt;
        return Sign(a.AsNumber() - *n);
    }
    if (a.IsString() && b.IsNumber()) {
        auto n = ParseNumber(a.AsString());
        if (!n) return std::nullopt;
        return Sign(*n - b.AsNumber());
    }
    // A timestamp field compared with an ISO date literal.
    if (a.IsTimestamp() && b.IsString()) {
        auto ts = ParseTimestamp(b.AsString());
        if (!ts) return std::nullopt;
        return CompareValues(a, Value(*ts));
    }
    if (a.IsString() && b.IsTimestamp()) {
        auto ts = ParseTimestamp(a.AsString());
        if (!ts) return std::nullopt;
        return CompareValues(Value(*ts), b);
    }
    return std::nullopt;
}

int CompareForSort(const Value& a, const Value& b) {
    const auto ka = static_cast<int>(a.Kind());
    const auto kb = static_cast<int>(b.Kind());
    if (ka != kb) {
        return ka < kb ? -1 : 1;
    }
    if (a.IsNested()) {
        const auto da = a.AsNested().dump();
        const auto db = b.AsNested().dump();
        return da < db ? -1 : (da > db ? 1 : 0);
    }
    if (a.IsNull()) {
        return 0;
    }
    return CompareValues(a, b).value_or(0);
}

} // namespace docfed
