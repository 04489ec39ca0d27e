#pragma once

#include <docfed/adapters/i_source_adapter.hpp>

#include <mutex>

namespace docfed {

// ---------------------------------------------------------------------------
// InlineAdapter: collections declared directly in the configuration file.
// ---------------------------------------------------------------------------
class InlineAdapter : public ISourceAdapter {
public:
    static constexpr const char* kType = "inline";

    InlineAdapter() = default;

    [[nodiscard]] Result<void, Error> Connect(const SourceConfig& config) override;
    [[nodiscard]] Result<std::vector<std::string>, Error> ListCollections() override;
    [[nodiscard]] Result<std::optional<std::vector<FieldInfo>>, Error>
    GetCollectionSchema(const std::string& collection) override;
    [[nodiscard]] Result<Rows, Error> ExecuteQuery(const std::string& collection,
                                                   const FilterSpec& spec) override;
    void Disconnect() override;
    [[nodiscard]] bool IsConnected() const override;

private:
    mutable std::mutex mutex_;
    CollectionMap collections_;
    bool connected_ = false;
};

} // namespace docfed
