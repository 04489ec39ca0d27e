#include <docfed/engine/source_registry.hpp>

#include <docfed/core/log.hpp>

#include <algorithm>
#include <future>
#include <thread>

namespace docfed {

namespace {

Error NotFound(const std::string& operation, const std::string& what, int64_t id) {
    return Error::Make(ErrorCategory::NotFound, operation, std::to_string(id),
                       what + " " + std::to_string(id) + " is not registered");
}

// Runs Connect on a detached thread so a hung store cannot block the caller
// past the timeout. The thread keeps the adapter alive until it returns.
Result<void, Error> ConnectWithTimeout(const std::shared_ptr<ISourceAdapter>& adapter,
                                       const SourceConfig& config,
                                       std::chrono::milliseconds timeout,
                                       const std::string& target) {
    auto promise = std::make_shared<std::promise<Result<void, Error>>>();
    auto future = promise->get_future();
    std::thread([adapter, config, promise] {
        promise->set_value(adapter->Connect(config));
    }).detach();

    if (future.wait_for(timeout) == std::future_status::timeout) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Timeout, "Connect", target,
            "Connect did not complete within " + std::to_string(timeout.count()) + " ms"));
    }
    return future.get();
}

} // anonymous namespace

SourceRegistry::SourceRegistry(const AdapterFactory& factory,
                               std::chrono::milliseconds connect_timeout)
    : factory_(factory),
      connect_timeout_(connect_timeout),
      sources_(std::make_shared<const SourceMap>()),
      mappings_(std::make_shared<const MappingList>()) {}

SourceRegistry::~SourceRegistry() {
    DisconnectAll();
}

std::shared_ptr<const SourceRegistry::SourceMap> SourceRegistry::Sources() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sources_;
}

// ===========================================================================
// Data sources
// ===========================================================================

Result<void, Error> SourceRegistry::AddSource(DataSource source) {
    if (!factory_.Has(source.type)) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Config, "AddDataSource", source.name,
            "Unknown data source type '" + source.type + "'"));
    }
    const SourceId id = source.id;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (sources_->count(id) > 0) {
            return Result<void, Error>::Err(Error::Make(
                ErrorCategory::Config, "AddDataSource", std::to_string(id),
                "A data source with this id is already registered"));
        }
        auto next = std::make_shared<SourceMap>(*sources_);
        source.status = SourceStatus::Disconnected;
        next->emplace(id, Entry{std::move(source), nullptr});
        sources_ = std::move(next);
    }
    LogInfo("registry", "Registered data source " + std::to_string(id));
    return Result<void, Error>::Ok();
}

Result<void, Error> SourceRegistry::UpdateSource(DataSource source) {
    if (!factory_.Has(source.type)) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Config, "UpdateDataSource", source.name,
            "Unknown data source type '" + source.type + "'"));
    }
    std::shared_ptr<ISourceAdapter> stale;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = sources_->find(source.id);
        if (it == sources_->end()) {
            return Result<void, Error>::Err(NotFound("UpdateDataSource", "Data source", source.id));
        }
        auto next = std::make_shared<SourceMap>(*sources_);
        Entry& entry = next->at(source.id);
        const bool reconnect = entry.source.config != source.config ||
                               entry.source.type != source.type;
        entry.source.name = std::move(source.name);
        if (reconnect) {
            entry.source.type = std::move(source.type);
            entry.source.config = std::move(source.config);
            entry.source.status = SourceStatus::Disconnected;
            entry.source.known_collections.clear();
            stale = std::move(entry.adapter);
            entry.adapter = nullptr;
        }
        sources_ = std::move(next);
    }
    if (stale) {
        LogInfo("registry", "Configuration of source " + std::to_string(source.id) +
                                " changed; disconnecting");
        stale->Disconnect();
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> SourceRegistry::RemoveSource(SourceId id) {
    std::shared_ptr<ISourceAdapter> adapter;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = sources_->find(id);
        if (it == sources_->end()) {
            return Result<void, Error>::Err(NotFound("RemoveDataSource", "Data source", id));
        }
        adapter = it->second.adapter;
        auto next = std::make_shared<SourceMap>(*sources_);
        next->erase(id);
        sources_ = std::move(next);
    }
    if (adapter) adapter->Disconnect();
    {
        std::lock_guard<std::mutex> lock(connect_locks_mutex_);
        connect_locks_.erase(id);
    }
    LogInfo("registry", "Removed data source " + std::to_string(id));
    return Result<void, Error>::Ok();
}

std::optional<DataSource> SourceRegistry::FindSource(SourceId id) const {
    auto sources = Sources();
    auto it = sources->find(id);
    if (it == sources->end()) return std::nullopt;
    return it->second.source;
}

std::vector<DataSource> SourceRegistry::ListSources() const {
    auto sources = Sources();
    std::vector<DataSource> out;
    out.reserve(sources->size());
    for (const auto& [id, entry] : *sources) out.push_back(entry.source);
    return out;
}

void SourceRegistry::SetStatus(SourceId id, SourceStatus status,
                               std::shared_ptr<ISourceAdapter> adapter,
                               std::optional<std::vector<std::string>> collections) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (sources_->count(id) == 0) return;  // removed meanwhile
    auto next = std::make_shared<SourceMap>(*sources_);
    Entry& entry = next->at(id);
    entry.source.status = status;
    entry.adapter = std::move(adapter);
    if (collections) entry.source.known_collections = std::move(*collections);
    sources_ = std::move(next);
}

std::shared_ptr<std::mutex> SourceRegistry::ConnectLock(SourceId id) {
    std::lock_guard<std::mutex> lock(connect_locks_mutex_);
    auto& slot = connect_locks_[id];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

std::shared_ptr<ISourceAdapter> SourceRegistry::LiveAdapter(SourceId id) const {
    auto sources = Sources();
    auto it = sources->find(id);
    if (it == sources->end() || !it->second.adapter || !it->second.adapter->IsConnected()) {
        return nullptr;
    }
    return it->second.adapter;
}

Result<std::shared_ptr<ISourceAdapter>, Error> SourceRegistry::Connect(SourceId id) {
    using R = Result<std::shared_ptr<ISourceAdapter>, Error>;
    if (auto live = LiveAdapter(id)) return R::Ok(std::move(live));

    auto connect_lock = ConnectLock(id);
    std::lock_guard<std::mutex> guard(*connect_lock);

    // Another caller may have connected while this one waited.
    if (auto live = LiveAdapter(id)) return R::Ok(std::move(live));

    auto sources = Sources();
    auto it = sources->find(id);
    if (it == sources->end()) {
        return R::Err(NotFound("Connect", "Data source", id));
    }
    const Entry& entry = it->second;

    const std::string target = entry.source.name.empty() ? std::to_string(id) : entry.source.name;
    auto created = factory_.Create(entry.source.type);
    if (created.IsErr()) {
        SetStatus(id, SourceStatus::Error, nullptr, std::nullopt);
        return R::Err(std::move(created).Error());
    }
    std::shared_ptr<ISourceAdapter> adapter = std::move(created).Value();

    auto connected = ConnectWithTimeout(adapter, entry.source.config, connect_timeout_, target);
    if (connected.IsErr()) {
        auto error = std::move(connected).Error();
        if (error.category != ErrorCategory::Timeout) {
            error.category = ErrorCategory::SourceConnection;
        }
        LogWarn("registry", error.ToString());
        SetStatus(id, SourceStatus::Error, nullptr, std::nullopt);
        return R::Err(std::move(error));
    }

    auto collections = adapter->ListCollections();
    if (collections.IsErr()) {
        auto error = std::move(collections).Error();
        LogWarn("registry", error.ToString());
        adapter->Disconnect();
        SetStatus(id, SourceStatus::Error, nullptr, std::nullopt);
        return R::Err(std::move(error));
    }

    LogInfo("registry", "Connected to " + target + " (" +
                            std::to_string(collections.Value().size()) + " collection(s))");
    SetStatus(id, SourceStatus::Connected, adapter, std::move(collections).Value());
    return R::Ok(std::move(adapter));
}

void SourceRegistry::DisconnectAll() {
    std::vector<std::shared_ptr<ISourceAdapter>> adapters;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto next = std::make_shared<SourceMap>(*sources_);
        for (auto& [id, entry] : *next) {
            if (entry.adapter) adapters.push_back(std::move(entry.adapter));
            entry.adapter = nullptr;
            entry.source.status = SourceStatus::Disconnected;
        }
        sources_ = std::move(next);
    }
    for (auto& adapter : adapters) adapter->Disconnect();
}

// ===========================================================================
// Mappings
// ===========================================================================

Result<void, Error> SourceRegistry::AddMapping(SchemaMapping mapping) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (sources_->count(mapping.source.source_id) == 0) {
        return Result<void, Error>::Err(
            NotFound("AddMapping", "Data source", mapping.source.source_id));
    }
    const bool duplicate = std::any_of(mappings_->begin(), mappings_->end(),
                                       [&](const SchemaMapping& m) { return m.id == mapping.id; });
    if (duplicate) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Config, "AddMapping", std::to_string(mapping.id),
            "A mapping with this id is already registered"));
    }
    auto next = std::make_shared<MappingList>(*mappings_);
    next->push_back(std::move(mapping));
    mappings_ = std::move(next);
    return Result<void, Error>::Ok();
}

Result<void, Error> SourceRegistry::RemoveMapping(MappingId id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto next = std::make_shared<MappingList>(*mappings_);
    auto it = std::remove_if(next->begin(), next->end(),
                             [id](const SchemaMapping& m) { return m.id == id; });
    if (it == next->end()) {
        return Result<void, Error>::Err(NotFound("RemoveMapping", "Mapping", id));
    }
    next->erase(it, next->end());
    mappings_ = std::move(next);
    return Result<void, Error>::Ok();
}

std::vector<SchemaMapping> SourceRegistry::ListMappings() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return *mappings_;
}

} // namespace docfed
