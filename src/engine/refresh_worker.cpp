#include <docfed/engine/refresh_worker.hpp>

#include <docfed/core/log.hpp>

#include <exception>

namespace docfed {

RefreshWorker::RefreshWorker(size_t thread_count)
    : thread_count_(thread_count > 0 ? thread_count : 1) {}

RefreshWorker::~RefreshWorker() {
    Stop();
}

void RefreshWorker::Start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ || stopped_) return;
        running_ = true;
    }
    threads_.reserve(thread_count_);
    for (size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back(&RefreshWorker::WorkerLoop, this);
    }
    LogDebug("strategy", "Refresh worker started with " + std::to_string(thread_count_) +
                             " thread(s)");
}

void RefreshWorker::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
        running_ = false;
        queue_.clear();
    }
    work_cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    idle_cv_.notify_all();
}

bool RefreshWorker::Enqueue(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_ || !task) return false;
        queue_.push_back(std::move(task));
    }
    work_cv_.notify_one();
    return true;
}

void RefreshWorker::WaitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return stopped_ || (queue_.empty() && active_ == 0); });
}

size_t RefreshWorker::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + active_;
}

void RefreshWorker::WorkerLoop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stopped_ || !queue_.empty(); });
            if (stopped_) return;
            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            LogError("strategy", std::string("Background refresh failed: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
        idle_cv_.notify_all();
    }
}

} // namespace docfed
