#include <docfed/adapters/inline_adapter.hpp>

namespace docfed {

namespace {

Error NotConnected(const char* operation) {
    return Error::Make(ErrorCategory::SourceConnection, operation, InlineAdapter::kType,
                       "Adapter is not connected");
}

} // anonymous namespace

Result<void, Error> InlineAdapter::Connect(const SourceConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    collections_ = config.collections;
    connected_ = true;
    return Result<void, Error>::Ok();
}

Result<std::vector<std::string>, Error> InlineAdapter::ListCollections() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        return Result<std::vector<std::string>, Error>::Err(NotConnected("ListCollections"));
    }
    std::vector<std::string> names;
    for (const auto& [name, rows] : collections_) names.push_back(name);
    return Result<std::vector<std::string>, Error>::Ok(std::move(names));
}

Result<std::optional<std::vector<FieldInfo>>, Error> InlineAdapter::GetCollectionSchema(
    const std::string& collection) {
    using R = Result<std::optional<std::vector<FieldInfo>>, Error>;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        return R::Err(NotConnected("GetCollectionSchema"));
    }
    auto it = collections_.find(collection);
    if (it == collections_.end()) {
        return R::Ok(std::nullopt);
    }
    return R::Ok(InferSchema(it->second));
}

Result<Rows, Error> InlineAdapter::ExecuteQuery(const std::string& collection,
                                                const FilterSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        return Result<Rows, Error>::Err(NotConnected("ExecuteQuery"));
    }
    auto it = collections_.find(collection);
    if (it == collections_.end()) {
        return Result<Rows, Error>::Ok(Rows{});
    }
    return Result<Rows, Error>::Ok(ApplyFilterSpec(it->second, spec));
}

void InlineAdapter::Disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
}

bool InlineAdapter::IsConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

} // namespace docfed
