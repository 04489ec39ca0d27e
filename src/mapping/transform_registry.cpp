#include <docfed/mapping/transform_registry.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>

namespace docfed {

namespace {

Value UpperCase(const Value& v) {
    if (!v.IsString()) return v;
    std::string s = v.AsString();
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return Value(std::move(s));
}

Value LowerCase(const Value& v) {
    if (!v.IsString()) return v;
    std::string s = v.AsString();
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return Value(std::move(s));
}

Value Trim(const Value& v) {
    if (!v.IsString()) return v;
    const std::string& s = v.AsString();
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(s.begin(), s.end(), is_space);
    auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    if (first >= last) return Value(std::string());
    return Value(std::string(first, last));
}

Value ToNumber(const Value& v) {
    if (v.IsString()) {
        if (auto n = ParseNumber(v.AsString())) return Value(*n);
        return v;
    }
    if (v.IsBool()) return Value(v.AsBool() ? 1.0 : 0.0);
    if (v.IsTimestamp()) return Value(static_cast<double>(v.AsTimestamp().millis));
    return v;
}

Value ToString(const Value& v) {
    if (v.IsNull() || v.IsString()) return v;
    return Value(v.ToDisplayString());
}

Value ToDate(const Value& v) {
    if (v.IsString()) {
        if (auto ts = ParseTimestamp(v.AsString())) return Value(*ts);
        return v;
    }
    if (!v.IsNumber()) return v;
    // [-2^63, 2^63): both bounds are exact doubles.
    constexpr double kMin = static_cast<double>(std::numeric_limits<int64_t>::min());
    constexpr double kMax = -kMin;
    const double millis = v.AsNumber();
    if (!std::isfinite(millis) || millis < kMin || millis >= kMax) return v;
    return Value(Timestamp{static_cast<int64_t>(millis)});
}

} // anonymous namespace

TransformRegistry::TransformRegistry() {
    Register("toUpperCase", UpperCase);
    Register("uppercase", UpperCase);
    Register("toLowerCase", LowerCase);
    Register("lowercase", LowerCase);
    Register("trim", Trim);
    Register("toNumber", ToNumber);
    Register("to-number", ToNumber);
    Register("toString", ToString);
    Register("to-string", ToString);
    Register("toDate", ToDate);
    Register("to-date", ToDate);
}

void TransformRegistry::Register(const std::string& name, TransformFn fn) {
    transforms_[name] = std::move(fn);
}

bool TransformRegistry::Has(const std::string& name) const {
    return transforms_.count(name) > 0;
}

Value TransformRegistry::Apply(const std::string& name, const Value& value,
                               bool* found) const {
    auto it = transforms_.find(name);
    if (found) *found = it != transforms_.end();
    if (it == transforms_.end()) {
        return value;
    }
    return it->second(value);
}

std::vector<std::string> TransformRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(transforms_.size());
    for (const auto& [name, fn] : transforms_) {
        names.push_back(name);
    }
    return names;
}

} // namespace docfed
