#include <catch2/catch_test_macros.hpp>

#include "task_queue.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

TEST_CASE("TaskQueue", "[task_queue]") {
    std::atomic<int> notified{0};
    TaskQueue queue([&notified]() { ++notified; });

    SECTION("RunsInPostOrder") {
        std::vector<int> order;
        queue.post([&order]() { order.push_back(1); });
        queue.post([&order]() { order.push_back(2); });
        queue.post([&order]() { order.push_back(3); });

        REQUIRE(notified == 3);
        REQUIRE(queue.run_pending() == 3);
        REQUIRE(order == std::vector<int>{1, 2, 3});
        REQUIRE(queue.empty());
    }

    SECTION("NothingPending") {
        REQUIRE(queue.empty());
        REQUIRE(queue.run_pending() == 0);
    }

    SECTION("TasksPostedWhileRunningWaitForNextRun") {
        int inner_runs = 0;
        queue.post([&]() {
            queue.post([&inner_runs]() { ++inner_runs; });
        });

        REQUIRE(queue.run_pending() == 1);
        REQUIRE(inner_runs == 0);
        REQUIRE_FALSE(queue.empty());

        REQUIRE(queue.run_pending() == 1);
        REQUIRE(inner_runs == 1);
    }

    SECTION("AcceptsMoveOnlyTasks") {
        auto value = std::make_unique<int>(42);
        int seen = 0;
        queue.post([v = std::move(value), &seen]() { seen = *v; });
        queue.run_pending();
        REQUIRE(seen == 42);
    }

    SECTION("PostFromOtherThreads") {
        int total = 0;
        {
            std::vector<std::jthread> producers;
            for (int t = 0; t < 4; ++t) {
                producers.emplace_back([&queue, &total]() {
                    for (int i = 0; i < 100; ++i) {
                        queue.post([&total]() { ++total; });
                    }
                });
            }
        }

        REQUIRE(queue.run_pending() == 400);
        REQUIRE(total == 400);
        REQUIRE(notified == 400);
    }
}
