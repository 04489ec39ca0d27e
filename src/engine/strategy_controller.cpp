#include <docfed/engine/strategy_controller.hpp>

#include <docfed/core/log.hpp>

#include <utility>

namespace docfed {

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
        .count();
}

// Runs `fn` when the scope ends, including by exception.
template <typename Fn>
class ScopeExit {
public:
    explicit ScopeExit(Fn fn) : fn_(std::move(fn)) {}
    ~ScopeExit() { fn_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    Fn fn_;
};

} // anonymous namespace

// ===========================================================================
// InMemoryResultStore
// ===========================================================================

Result<void, Error> InMemoryResultStore::SaveQueryResult(const std::string& key,
                                                         const FederatedResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_[key] = result;
    ++saves_;
    return Result<void, Error>::Ok();
}

std::optional<FederatedResult> InMemoryResultStore::Find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = results_.find(key);
    if (it == results_.end()) return std::nullopt;
    return it->second;
}

size_t InMemoryResultStore::SaveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saves_;
}

// ===========================================================================
// StrategyController
// ===========================================================================

StrategyController::StrategyController(const IClock& clock,
                                       std::chrono::minutes refresh_interval,
                                       size_t refresh_threads, IResultStore* result_store)
    : clock_(clock),
      refresh_interval_(refresh_interval),
      result_store_(result_store),
      worker_(refresh_threads) {
    worker_.Start();
}

StrategyController::~StrategyController() {
    worker_.Stop();
}

StrategyController::EntryPtr StrategyController::Lookup(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    return it == cache_.end() ? nullptr : it->second;
}

void StrategyController::Store(const std::string& key, const FederatedResult& result) {
    auto entry = std::make_shared<const Entry>(Entry{result});
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_[key] = std::move(entry);
    }
    if (result_store_) {
        auto saved = result_store_->SaveQueryResult(key, result);
        if (saved.IsErr()) {
            LogWarn("strategy", "Result not saved: " + saved.Error().ToString());
        }
    }
}

Result<FederatedResult, Error> StrategyController::ExecuteFresh(const std::string& key,
                                                                FederationStrategy strategy,
                                                                const ExecuteFn& execute) {
    auto executed = execute();
    if (executed.IsErr()) {
        return executed;
    }
    FederatedResult result = std::move(executed).Value();
    result.cache_hit = false;
    result.last_updated = clock_.Now();
    result.next_update = std::nullopt;
    if (strategy == FederationStrategy::Materialized) {
        const auto interval =
            std::chrono::duration_cast<std::chrono::milliseconds>(refresh_interval_).count();
        result.next_update = Timestamp{result.last_updated.millis + interval};
    }
    if (strategy != FederationStrategy::Virtual) {
        Store(key, result);
    }
    return Result<FederatedResult, Error>::Ok(std::move(result));
}

void StrategyController::ScheduleRefresh(const std::string& key, ExecuteFn execute) {
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!in_flight_.insert(key).second) {
            LogDebug("strategy", "Refresh of '" + key + "' already in flight");
            return;
        }
        generation = generation_;
    }

    const bool queued = worker_.Enqueue([this, key, execute = std::move(execute), generation] {
        ScopeExit release([this, &key] { ReleaseInFlight(key); });
        const auto started = std::chrono::steady_clock::now();
        auto executed = execute();
        if (executed.IsErr()) {
            LogWarn("strategy", "Background refresh of '" + key + "' failed: " +
                                    executed.Error().ToString());
            return;
        }
        FederatedResult result = std::move(executed).Value();
        result.cache_hit = false;
        result.last_updated = clock_.Now();
        result.next_update = std::nullopt;
        result.execution_time_ms = ElapsedMs(started);

        bool current = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current = generation == generation_;
        }
        if (current) {
            Store(key, result);
            LogDebug("strategy", "Refreshed '" + key + "'");
        }
    });
    if (!queued) ReleaseInFlight(key);
}

void StrategyController::ReleaseInFlight(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(key);
}

Result<FederatedResult, Error> StrategyController::Run(const std::string& key,
                                                       FederationStrategy strategy,
                                                       ExecuteFn execute) {
    const auto started = std::chrono::steady_clock::now();
    const auto finish = [&started](Result<FederatedResult, Error> result) {
        if (result.IsErr()) return result;
        FederatedResult value = std::move(result).Value();
        value.execution_time_ms = ElapsedMs(started);
        return Result<FederatedResult, Error>::Ok(std::move(value));
    };

    switch (strategy) {
        case FederationStrategy::Virtual:
            return finish(ExecuteFresh(key, strategy, execute));

        case FederationStrategy::Materialized: {
            EntryPtr entry = Lookup(key);
            const Timestamp now = clock_.Now();
            if (entry && entry->result.next_update && now < *entry->result.next_update) {
                LogDebug("strategy", "Serving '" + key + "' from cache");
                FederatedResult cached = entry->result;
                cached.cache_hit = true;
                return finish(Result<FederatedResult, Error>::Ok(std::move(cached)));
            }
            return finish(ExecuteFresh(key, strategy, execute));
        }

        case FederationStrategy::Hybrid: {
            EntryPtr entry = Lookup(key);
            if (!entry) {
                return finish(ExecuteFresh(key, strategy, execute));
            }
            FederatedResult cached = entry->result;
            cached.cache_hit = true;
            ScheduleRefresh(key, std::move(execute));
            return finish(Result<FederatedResult, Error>::Ok(std::move(cached)));
        }
    }
    return Result<FederatedResult, Error>::Err(Error::Make(
        ErrorCategory::UnknownStrategy, "RunQuery", key, "Unhandled federation strategy"));
}

void StrategyController::Invalidate(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(key);
    ++generation_;
}

void StrategyController::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    ++generation_;
}

void StrategyController::WaitForRefreshes() {
    worker_.WaitIdle();
}

size_t StrategyController::CachedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

} // namespace docfed
