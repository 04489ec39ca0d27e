#include <catch2/catch_test_macros.hpp>

#include <docfed/engine/refresh_worker.hpp>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace docfed;

TEST_CASE("RefreshWorker: runs queued tasks in order", "[worker]") {
    RefreshWorker worker(1);
    worker.Start();

    std::mutex mutex;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        worker.Enqueue([&, i] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        });
    }
    worker.WaitIdle();
    CHECK(order == std::vector<int>{0, 1, 2, 3, 4});
    CHECK(worker.Pending() == 0);
}

TEST_CASE("RefreshWorker: several threads drain the queue", "[worker]") {
    RefreshWorker worker(4);
    worker.Start();

    std::atomic<int> count{0};
    for (int i = 0; i < 100; ++i) {
        worker.Enqueue([&count] { ++count; });
    }
    worker.WaitIdle();
    CHECK(count.load() == 100);
}

TEST_CASE("RefreshWorker: a throwing task does not stop the worker", "[worker]") {
    RefreshWorker worker;
    worker.Start();

    std::atomic<bool> ran{false};
    worker.Enqueue([] { throw std::runtime_error("boom"); });
    worker.Enqueue([&ran] { ran = true; });
    worker.WaitIdle();
    CHECK(ran.load());
}

TEST_CASE("RefreshWorker: tasks enqueued after Stop are ignored", "[worker]") {
    RefreshWorker worker;
    worker.Start();
    worker.Stop();

    std::atomic<bool> ran{false};
    CHECK_FALSE(worker.Enqueue([&ran] { ran = true; }));
    CHECK(worker.Pending() == 0);
    worker.WaitIdle();
    CHECK_FALSE(ran.load());
}

TEST_CASE("RefreshWorker: Stop is idempotent and Start after Stop is a no-op", "[worker]") {
    RefreshWorker worker(2);
    worker.Start();
    worker.Stop();
    worker.Stop();
    worker.Start();
    worker.Enqueue([] {});
    CHECK(worker.Pending() == 0);
}
