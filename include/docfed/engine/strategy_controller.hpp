#pragma once

#include <docfed/core/result.hpp>
#include <docfed/core/types.hpp>
#include <docfed/engine/clock.hpp>
#include <docfed/engine/federated_result.hpp>
#include <docfed/engine/refresh_worker.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace docfed {

// ---------------------------------------------------------------------------
// IResultStore: receives every fresh materialized/hybrid result.
// ---------------------------------------------------------------------------
class IResultStore {
public:
    virtual ~IResultStore() = default;
    [[nodiscard]] virtual Result<void, Error> SaveQueryResult(const std::string& key,
                                                              const FederatedResult& result) = 0;
};

class InMemoryResultStore : public IResultStore {
public:
    [[nodiscard]] Result<void, Error> SaveQueryResult(const std::string& key,
                                                      const FederatedResult& result) override;

    [[nodiscard]] std::optional<FederatedResult> Find(const std::string& key) const;
    [[nodiscard]] size_t SaveCount() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, FederatedResult> results_;
    size_t saves_ = 0;
};

// ---------------------------------------------------------------------------
// StrategyController: decides per query key whether to execute or to serve
// the cached result.
//
//   virtual       always execute, never cache
//   materialized  serve the cache until next_update, then execute
//   hybrid        serve the cache and refresh it in the background; at most
//                 one refresh per key is in flight
//
// With no cached result, materialized and hybrid execute synchronously.
// Failed executions are returned as-is and never cached. Cache slots are
// immutable and replaced whole.
// ---------------------------------------------------------------------------
class StrategyController {
public:
    using ExecuteFn = std::function<Result<FederatedResult, Error>()>;

    StrategyController(const IClock& clock, std::chrono::minutes refresh_interval,
                       size_t refresh_threads = 1, IResultStore* result_store = nullptr);
    ~StrategyController();

    StrategyController(const StrategyController&) = delete;
    StrategyController& operator=(const StrategyController&) = delete;

    /// `execute` may be invoked later on a refresh thread (hybrid), so it
    /// must own or outlive everything it captures.
    [[nodiscard]] Result<FederatedResult, Error> Run(const std::string& key,
                                                     FederationStrategy strategy,
                                                     ExecuteFn execute);

    void Invalidate(const std::string& key);
    void Clear();

    /// Block until queued background refreshes have finished.
    void WaitForRefreshes();

    [[nodiscard]] size_t CachedCount() const;
    [[nodiscard]] std::chrono::minutes RefreshInterval() const noexcept {
        return refresh_interval_;
    }

private:
    struct Entry {
        FederatedResult result;
    };
    using EntryPtr = std::shared_ptr<const Entry>;

    EntryPtr Lookup(const std::string& key) const;
    void Store(const std::string& key, const FederatedResult& result);
    Result<FederatedResult, Error> ExecuteFresh(const std::string& key,
                                                FederationStrategy strategy,
                                                const ExecuteFn& execute);
    void ScheduleRefresh(const std::string& key, ExecuteFn execute);
    void ReleaseInFlight(const std::string& key);

    const IClock& clock_;
    std::chrono::minutes refresh_interval_;
    IResultStore* result_store_;

    mutable std::mutex mutex_;
    std::map<std::string, EntryPtr> cache_;
    std::set<std::string> in_flight_;
    uint64_t generation_ = 0;  // bumped by Invalidate/Clear

    RefreshWorker worker_;
};

} // namespace docfed
