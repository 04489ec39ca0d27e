#include <docfed/adapters/adapter_factory.hpp>

#include <docfed/adapters/inline_adapter.hpp>
#include <docfed/adapters/json_dir_adapter.hpp>

namespace docfed {

AdapterFactory AdapterFactory::WithBuiltins() {
    AdapterFactory factory;
    factory.Register(JsonDirAdapter::kType, [] { return std::make_unique<JsonDirAdapter>(); });
    factory.Register(InlineAdapter::kType, [] { return std::make_unique<InlineAdapter>(); });
    return factory;
}

void AdapterFactory::Register(const std::string& type, AdapterCreator creator) {
    creators_[type] = std::move(creator);
}

bool AdapterFactory::Has(const std::string& type) const {
    return creators_.count(type) > 0;
}

Result<std::unique_ptr<ISourceAdapter>, Error> AdapterFactory::Create(
    const std::string& type) const {
    auto it = creators_.find(type);
    if (it == creators_.end()) {
        std::string known;
        for (const auto& [name, creator] : creators_) {
            if (!known.empty()) known += ", ";
            known += name;
        }
        return Result<std::unique_ptr<ISourceAdapter>, Error>::Err(Error::Make(
            ErrorCategory::Config, "CreateAdapter", type,
            "Unknown data source type (known: " + known + ")"));
    }
    return Result<std::unique_ptr<ISourceAdapter>, Error>::Ok(it->second());
}

std::vector<std::string> AdapterFactory::Types() const {
    std::vector<std::string> out;
    for (const auto& [name, creator] : creators_) out.push_back(name);
    return out;
}

} // namespace docfed
