#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace docfed {

// ---------------------------------------------------------------------------
// RefreshWorker: small pool of threads running background refresh tasks.
// Tasks run in FIFO order. Stop() lets running tasks finish, drops queued
// ones and joins the threads.
// ---------------------------------------------------------------------------
class RefreshWorker {
public:
    using Task = std::function<void()>;

    explicit RefreshWorker(size_t thread_count = 1);
    ~RefreshWorker();

    RefreshWorker(const RefreshWorker&) = delete;
    RefreshWorker& operator=(const RefreshWorker&) = delete;

    // Spawn the threads. Must be called once; later calls are no-ops.
    void Start();

    // Signal the threads to stop and join them.
    void Stop();

    // Queue a task. Returns false, dropping the task, after Stop().
    bool Enqueue(Task task);

    // Block until the queue is empty and no task is running.
    void WaitIdle();

    [[nodiscard]] size_t Pending() const;

private:
    void WorkerLoop();

    size_t thread_count_;
    std::vector<std::thread> threads_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> queue_;
    size_t active_ = 0;
    bool running_ = false;
    bool stopped_ = false;
};

} // namespace docfed
