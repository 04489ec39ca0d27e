#pragma once

#include <docfed/adapters/i_source_adapter.hpp>

#include <filesystem>
#include <mutex>

namespace docfed {

// ---------------------------------------------------------------------------
// JsonDirAdapter: a directory of "<collection>.json" files, each holding a
// JSON array of objects. Config: `path` (required).
// ---------------------------------------------------------------------------
class JsonDirAdapter : public ISourceAdapter {
public:
    static constexpr const char* kType = "json-dir";

    JsonDirAdapter() = default;

    [[nodiscard]] Result<void, Error> Connect(const SourceConfig& config) override;
    [[nodiscard]] Result<std::vector<std::string>, Error> ListCollections() override;
    [[nodiscard]] Result<std::optional<std::vector<FieldInfo>>, Error>
    GetCollectionSchema(const std::string& collection) override;
    [[nodiscard]] Result<Rows, Error> ExecuteQuery(const std::string& collection,
                                                   const FilterSpec& spec) override;
    void Disconnect() override;
    [[nodiscard]] bool IsConnected() const override;

private:
    Result<std::filesystem::path, Error> Root(const char* operation) const;
    Result<Rows, Error> ReadCollection(const std::filesystem::path& file) const;

    mutable std::mutex mutex_;
    std::filesystem::path root_;
    bool connected_ = false;
};

} // namespace docfed
