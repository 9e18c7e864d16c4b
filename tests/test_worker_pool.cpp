#include <catch2/catch_test_macros.hpp>

#include "jobs/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("WorkerPool", "[workers]") {

    SECTION("RunsAllTasks") {
        std::atomic<int> done{0};
        {
            WorkerPool pool(3);
            REQUIRE(pool.size() == 3);
            for (int i = 0; i < 50; ++i) {
                REQUIRE(pool.submit([&done] { done++; }));
            }
        } // destructor drains the queue
        REQUIRE(done == 50);
    }

    SECTION("UsesSeveralThreads") {
        std::mutex m;
        std::set<std::thread::id> ids;
        WorkerPool pool(2);
        for (int i = 0; i < 8; ++i) {
            pool.submit([&] {
                std::this_thread::sleep_for(10ms);
                std::lock_guard lock(m);
                ids.insert(std::this_thread::get_id());
            });
        }
        pool.shutdown();
        REQUIRE(ids.size() == 2);
    }

    SECTION("RejectsAfterShutdown") {
        WorkerPool pool(1);
        pool.shutdown();
        REQUIRE_FALSE(pool.submit([] {}));
        pool.shutdown(); // idempotent
    }

    SECTION("QueueDepth") {
        WorkerPool pool(1);
        std::atomic<bool> release{false};
        std::atomic<bool> started{false};
        pool.submit([&] {
            started = true;
            while (!release) std::this_thread::sleep_for(1ms);
        });
        while (!started) std::this_thread::sleep_for(1ms);

        pool.submit([] {});
        pool.submit([] {});
        REQUIRE(pool.active() == 1);
        REQUIRE(pool.queue_depth() == 2);

        release = true;
        pool.shutdown();
        REQUIRE(pool.queue_depth() == 0);
        REQUIRE(pool.active() == 0);
    }

    SECTION("ThrowingTaskDoesNotKillWorker") {
        std::atomic<int> done{0};
        WorkerPool pool(1);
        pool.submit([] { throw std::runtime_error("task failure"); });
        pool.submit([&done] { done++; });
        pool.shutdown();
        REQUIRE(done == 1);
    }
}
