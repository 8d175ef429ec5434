#include <catch2/catch_test_macros.hpp>

#include "infrastructure/probe/WorkerPool.hpp"

#include <atomic>
#include <new>
#include <stdexcept>

using namespace ftpprobe::infra;

TEST_CASE("WorkerPool runs every queued handler before drain returns", "[WorkerPool]") {
    WorkerPool pool(3);
    REQUIRE(pool.threadCount() == 3);

    std::atomic<int> ran{0};
    for (int i = 0; i < 50; ++i) {
        pool.post([&ran]() { ++ran; });
    }
    pool.drain();

    REQUIRE(ran.load() == 50);
    REQUIRE(pool.failedHandlers() == 0);
}

TEST_CASE("WorkerPool survives throwing handlers", "[WorkerPool]") {
    WorkerPool pool(1);
    std::atomic<int> ran{0};

    pool.post([]() { throw std::runtime_error("handler failed"); });
    pool.post([&ran]() { ++ran; });
    pool.post([]() { throw std::bad_alloc(); });
    pool.post([&ran]() { ++ran; });
    pool.drain();

    REQUIRE(ran.load() == 2);
    REQUIRE(pool.failedHandlers() == 2);
}

TEST_CASE("WorkerPool thread count and repeated drain", "[WorkerPool]") {
    WorkerPool pool(0);
    REQUIRE(pool.threadCount() == 1);

    pool.drain();
    pool.drain();
    REQUIRE(pool.failedHandlers() == 0);
}
