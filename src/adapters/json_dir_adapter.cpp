#include <docfed/adapters/json_dir_adapter.hpp>

#include <docfed/core/log.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace docfed {

namespace fs = std::filesystem;

namespace {

constexpr const char* kExtension = ".json";

Error ConnectionError(const char* operation, const std::string& target,
                      const std::string& message,
                      std::optional<std::string> detail = std::nullopt) {
    return Error::Make(ErrorCategory::SourceConnection, operation, target, message,
                       std::move(detail));
}

} // anonymous namespace

Result<void, Error> JsonDirAdapter::Connect(const SourceConfig& config) {
    auto path = config.Setting("path");
    if (!path || path->empty()) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Config, "Connect", kType, "json-dir source requires a 'path' setting"));
    }
    std::error_code ec;
    if (!fs::is_directory(*path, ec)) {
        return Result<void, Error>::Err(
            ConnectionError("Connect", *path, "Directory does not exist or is not readable",
                            ec ? std::optional<std::string>(ec.message()) : std::nullopt));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    root_ = *path;
    connected_ = true;
    LogDebug("adapter", "json-dir connected to " + root_.string());
    return Result<void, Error>::Ok();
}

Result<fs::path, Error> JsonDirAdapter::Root(const char* operation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        return Result<fs::path, Error>::Err(
            ConnectionError(operation, kType, "Adapter is not connected"));
    }
    return Result<fs::path, Error>::Ok(root_);
}

Result<std::vector<std::string>, Error> JsonDirAdapter::ListCollections() {
    auto root = Root("ListCollections");
    if (root.IsErr()) {
        return Result<std::vector<std::string>, Error>::Err(std::move(root).Error());
    }

    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(root.Value(), ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        if (entry.is_regular_file() && entry.path().extension() == kExtension) {
            names.push_back(entry.path().stem().string());
        }
    }
    if (ec) {
        return Result<std::vector<std::string>, Error>::Err(ConnectionError(
            "ListCollections", root.Value().string(), "Failed to list directory", ec.message()));
    }
    std::sort(names.begin(), names.end());
    return Result<std::vector<std::string>, Error>::Ok(std::move(names));
}

Result<Rows, Error> JsonDirAdapter::ReadCollection(const fs::path& file) const {
    std::ifstream in(file);
    if (!in) {
        return Result<Rows, Error>::Err(
            ConnectionError("ExecuteQuery", file.string(), "Cannot open collection file"));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    Json parsed;
    try {
        parsed = Json::parse(buffer.str());
    } catch (const Json::parse_error& e) {
        return Result<Rows, Error>::Err(
            ConnectionError("ExecuteQuery", file.string(), "Malformed JSON", e.what()));
    }
    auto rows = RowsFromJson(parsed);
    if (rows.IsErr()) {
        auto error = std::move(rows).Error();
        error.category = ErrorCategory::SourceConnection;
        error.target = file.string();
        return Result<Rows, Error>::Err(std::move(error));
    }
    return rows;
}

Result<std::optional<std::vector<FieldInfo>>, Error> JsonDirAdapter::GetCollectionSchema(
    const std::string& collection) {
    using R = Result<std::optional<std::vector<FieldInfo>>, Error>;
    auto root = Root("GetCollectionSchema");
    if (root.IsErr()) {
        return R::Err(std::move(root).Error());
    }
    const fs::path file = root.Value() / (collection + kExtension);
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return R::Ok(std::nullopt);
    }
    auto rows = ReadCollection(file);
    if (rows.IsErr()) {
        return R::Err(std::move(rows).Error());
    }
    return R::Ok(InferSchema(rows.Value()));
}

Result<Rows, Error> JsonDirAdapter::ExecuteQuery(const std::string& collection,
                                                 const FilterSpec& spec) {
    auto root = Root("ExecuteQuery");
    if (root.IsErr()) {
        return Result<Rows, Error>::Err(std::move(root).Error());
    }
    const fs::path file = root.Value() / (collection + kExtension);
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return Result<Rows, Error>::Ok(Rows{});
    }
    auto rows = ReadCollection(file);
    if (rows.IsErr()) {
        return rows;
    }
    return Result<Rows, Error>::Ok(ApplyFilterSpec(rows.Value(), spec));
}

void JsonDirAdapter::Disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
}

bool JsonDirAdapter::IsConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

} // namespace docfed
