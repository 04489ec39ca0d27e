#pragma once

#include <docfed/core/value.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace docfed {

// A field transform: pure function from one value to another.
using TransformFn = std::function<Value(const Value&)>;

// ---------------------------------------------------------------------------
// TransformRegistry: named field transforms used by schema mapping rules.
//
// Built-ins (each under two names):
//   toUpperCase / uppercase    strings only
//   toLowerCase / lowercase    strings only
//   trim                       strings only
//   toNumber    / to-number    numeric strings and booleans to number
//   toString    / to-string    any scalar to its display text
//   toDate      / to-date      ISO strings and epoch millis to timestamp
//
// A transform that does not understand a value's kind returns it unchanged.
// ---------------------------------------------------------------------------
class TransformRegistry {
public:
    /// Registry pre-populated with the built-in transforms.
    TransformRegistry();

    /// Add or replace a transform. Used for `custom` mapping rules.
    void Register(const std::string& name, TransformFn fn);

    [[nodiscard]] bool Has(const std::string& name) const;

    /// Apply the named transform. An unknown name returns the value
    /// unchanged and sets `*found` to false.
    [[nodiscard]] Value Apply(const std::string& name, const Value& value,
                              bool* found = nullptr) const;

    /// Sorted list of registered names.
    [[nodiscard]] std::vector<std::string> Names() const;

private:
    std::map<std::string, TransformFn> transforms_;
};

} // namespace docfed
