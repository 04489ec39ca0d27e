#include <docfed/engine/snapshot_store.hpp>

#include <docfed/core/log.hpp>

#include <fstream>
#include <sstream>

namespace docfed {

namespace fs = std::filesystem;

namespace {

Error StorageError(const std::string& operation, const std::string& target,
                   const std::string& message,
                   std::optional<std::string> detail = std::nullopt) {
    return Error::Make(ErrorCategory::Internal, operation, target, message, std::move(detail));
}

bool IsNewer(const SnapshotPtr& existing, const CollectionSnapshot& incoming) {
    return !existing || !(incoming.fetched_at < existing->fetched_at);
}

} // anonymous namespace

// ===========================================================================
// JSON form
// ===========================================================================

Json SnapshotToJson(const CollectionSnapshot& snapshot) {
    Json j;
    j["source_id"] = snapshot.source_id;
    j["collection"] = snapshot.collection;
    j["fetched_at"] = FormatTimestamp(snapshot.fetched_at);
    j["schema"] = SchemaToJson(snapshot.schema);
    j["rows"] = RowsToJson(snapshot.rows);
    return j;
}

Result<CollectionSnapshot, Error> SnapshotFromJson(const Json& json) {
    using R = Result<CollectionSnapshot, Error>;
    if (!json.is_object() || !json.contains("source_id") || !json.contains("collection") ||
        !json.contains("fetched_at") || !json.contains("rows")) {
        return R::Err(StorageError("SnapshotFromJson", "",
                                   "Snapshot must have source_id, collection, fetched_at and rows"));
    }
    if (!json["source_id"].is_number_integer() || !json["collection"].is_string() ||
        !json["fetched_at"].is_string()) {
        return R::Err(StorageError("SnapshotFromJson", "", "Snapshot header has wrong types"));
    }

    CollectionSnapshot snapshot;
    snapshot.source_id = json["source_id"].get<SourceId>();
    snapshot.collection = json["collection"].get<std::string>();

    auto fetched = ParseTimestamp(json["fetched_at"].get<std::string>());
    if (!fetched) {
        return R::Err(StorageError("SnapshotFromJson", snapshot.collection,
                                   "Invalid fetched_at timestamp"));
    }
    snapshot.fetched_at = *fetched;

    auto rows = RowsFromJson(json["rows"]);
    if (rows.IsErr()) {
        return R::Err(std::move(rows).Error());
    }
    snapshot.rows = std::move(rows).Value();

    if (json.contains("schema")) {
        auto schema = SchemaFromJson(json["schema"]);
        if (schema.IsErr()) {
            return R::Err(std::move(schema).Error());
        }
        snapshot.schema = std::move(schema).Value();
    } else {
        snapshot.schema = InferSchema(snapshot.rows);
    }
    return R::Ok(std::move(snapshot));
}

// ===========================================================================
// InMemorySnapshotStore
// ===========================================================================

Result<SnapshotPtr, Error> InMemorySnapshotStore::GetLatest(SourceId source_id,
                                                           const std::string& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = snapshots_.find(CollectionRef{source_id, collection});
    return Result<SnapshotPtr, Error>::Ok(it == snapshots_.end() ? nullptr : it->second);
}

Result<void, Error> InMemorySnapshotStore::Put(CollectionSnapshot snapshot) {
    const CollectionRef key{snapshot.source_id, snapshot.collection};
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = snapshots_[key];
    if (IsNewer(slot, snapshot)) {
        slot = std::make_shared<const CollectionSnapshot>(std::move(snapshot));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> InMemorySnapshotStore::DropSource(SourceId source_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = snapshots_.begin(); it != snapshots_.end();) {
        it = it->first.source_id == source_id ? snapshots_.erase(it) : std::next(it);
    }
    return Result<void, Error>::Ok();
}

// ===========================================================================
// FileSnapshotStore
// ===========================================================================

FileSnapshotStore::FileSnapshotStore(OpenKey, fs::path dir) : dir_(std::move(dir)) {}

Result<std::unique_ptr<FileSnapshotStore>, Error> FileSnapshotStore::Open(const fs::path& dir) {
    using R = Result<std::unique_ptr<FileSnapshotStore>, Error>;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir)) {
        return R::Err(Error::Make(ErrorCategory::Config, "OpenSnapshotStore", dir.string(),
                                  "Cannot create snapshot directory",
                                  ec ? std::optional<std::string>(ec.message()) : std::nullopt));
    }
    return R::Ok(std::make_unique<FileSnapshotStore>(OpenKey{}, dir));
}

fs::path FileSnapshotStore::FileFor(SourceId source_id, const std::string& collection) const {
    return dir_ / (std::to_string(source_id) + "__" + collection + ".json");
}

Result<SnapshotPtr, Error> FileSnapshotStore::GetLatest(SourceId source_id,
                                                       const std::string& collection) {
    using R = Result<SnapshotPtr, Error>;
    const CollectionRef key{source_id, collection};
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = cache_.find(key); it != cache_.end()) {
        return R::Ok(it->second);
    }

    const fs::path file = FileFor(source_id, collection);
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return R::Ok(nullptr);
    }
    std::ifstream in(file);
    if (!in) {
        return R::Err(StorageError("GetLatest", file.string(), "Cannot open snapshot file"));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    Json parsed;
    try {
        parsed = Json::parse(buffer.str());
    } catch (const Json::parse_error& e) {
        return R::Err(StorageError("GetLatest", file.string(), "Malformed snapshot file", e.what()));
    }
    auto snapshot = SnapshotFromJson(parsed);
    if (snapshot.IsErr()) {
        return R::Err(std::move(snapshot).Error());
    }
    auto ptr = std::make_shared<const CollectionSnapshot>(std::move(snapshot).Value());
    cache_[key] = ptr;
    return R::Ok(std::move(ptr));
}

Result<void, Error> FileSnapshotStore::Put(CollectionSnapshot snapshot) {
    const CollectionRef key{snapshot.source_id, snapshot.collection};
    const fs::path file = FileFor(snapshot.source_id, snapshot.collection);
    const fs::path tmp = file.string() + ".tmp";

    std::lock_guard<std::mutex> lock(mutex_);
    auto cached = cache_.find(key);
    if (cached != cache_.end() && !IsNewer(cached->second, snapshot)) {
        return Result<void, Error>::Ok();
    }

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Result<void, Error>::Err(
                StorageError("PutSnapshot", tmp.string(), "Cannot write snapshot file"));
        }
        out << SnapshotToJson(snapshot).dump(2);
        if (!out) {
            return Result<void, Error>::Err(
                StorageError("PutSnapshot", tmp.string(), "Write failed"));
        }
    }
    std::error_code ec;
    fs::rename(tmp, file, ec);
    if (ec) {
        return Result<void, Error>::Err(
            StorageError("PutSnapshot", file.string(), "Cannot replace snapshot file", ec.message()));
    }

    LogDebug("snapshot", "Stored " + file.filename().string());
    cache_[key] = std::make_shared<const CollectionSnapshot>(std::move(snapshot));
    return Result<void, Error>::Ok();
}

Result<void, Error> FileSnapshotStore::DropSource(SourceId source_id) {
    const std::string prefix = std::to_string(source_id) + "__";
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = cache_.begin(); it != cache_.end();) {
        it = it->first.source_id == source_id ? cache_.erase(it) : std::next(it);
    }

    std::error_code ec;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.rfind(prefix, 0) == 0) {
            std::error_code remove_ec;
            fs::remove(it->path(), remove_ec);
            if (remove_ec) {
                LogWarn("snapshot", "Cannot remove " + name + ": " + remove_ec.message());
            }
        }
    }
    if (ec) {
        return Result<void, Error>::Err(
            StorageError("DropSource", dir_.string(), "Cannot list snapshot directory", ec.message()));
    }
    return Result<void, Error>::Ok();
}

} // namespace docfed
