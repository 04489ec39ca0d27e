#pragma once

#include <docfed/adapters/i_source_adapter.hpp>
#include <docfed/core/result.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace docfed {

using AdapterCreator = std::function<std::unique_ptr<ISourceAdapter>()>;

// ---------------------------------------------------------------------------
// AdapterFactory: creates source adapters by data source type token.
// ---------------------------------------------------------------------------
class AdapterFactory {
public:
    /// Factory with the built-in "json-dir" and "inline" adapters.
    static AdapterFactory WithBuiltins();

    void Register(const std::string& type, AdapterCreator creator);

    [[nodiscard]] bool Has(const std::string& type) const;

    /// Fails with a Config error for an unregistered type.
    [[nodiscard]] Result<std::unique_ptr<ISourceAdapter>, Error> Create(
        const std::string& type) const;

    [[nodiscard]] std::vector<std::string> Types() const;

private:
    std::map<std::string, AdapterCreator> creators_;
};

} // namespace docfed
