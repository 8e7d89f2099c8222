#include <catch2/catch_test_macros.hpp>

#include <op_mcp/backend/connection_pool.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace op_mcp;
using namespace std::chrono_literals;

namespace {

std::chrono::steady_clock::time_point In(std::chrono::milliseconds ms) {
    return std::chrono::steady_clock::now() + ms;
}

} // anonymous namespace

TEST_CASE("ConnectionPool: leases count against capacity", "[backend][pool]") {
    ConnectionPool pool(2);
    auto a = pool.Acquire(In(100ms));
    auto b = pool.Acquire(In(100ms));
    REQUIRE(a.IsOk());
    REQUIRE(b.IsOk());
    CHECK(pool.InFlight() == 2);

    auto c = pool.Acquire(In(30ms));
    REQUIRE(c.IsErr());
    CHECK(c.Error().category == ErrorCategory::Timeout);
}

TEST_CASE("ConnectionPool: releasing a lease frees the slot", "[backend][pool]") {
    ConnectionPool pool(1);
    {
        auto lease = pool.Acquire(In(100ms));
        REQUIRE(lease.IsOk());
        CHECK(pool.InFlight() == 1);
    }
    CHECK(pool.InFlight() == 0);

    auto lease = pool.Acquire(In(100ms));
    REQUIRE(lease.IsOk());
    Lease held = std::move(lease).Value();
    CHECK(held.Valid());
    held.Release();
    CHECK_FALSE(held.Valid());
    held.Release();
    CHECK(pool.InFlight() == 0);
}

TEST_CASE("ConnectionPool: moved lease releases once", "[backend][pool]") {
    ConnectionPool pool(1);
    Lease outer;
    {
        auto r = pool.Acquire(In(100ms));
        REQUIRE(r.IsOk());
        Lease inner = std::move(r).Value();
        outer = std::move(inner);
        CHECK_FALSE(inner.Valid());
    }
    CHECK(pool.InFlight() == 1);
    outer.Release();
    CHECK(pool.InFlight() == 0);
}

TEST_CASE("ConnectionPool: waiter proceeds when a slot frees up", "[backend][pool]") {
    ConnectionPool pool(1);
    auto first = pool.Acquire(In(100ms));
    REQUIRE(first.IsOk());
    Lease held = std::move(first).Value();

    std::thread releaser([&held] {
        std::this_thread::sleep_for(30ms);
        held.Release();
    });
    auto second = pool.Acquire(In(2000ms));
    releaser.join();
    CHECK(second.IsOk());
}

TEST_CASE("ConnectionPool: cancellation ends the wait", "[backend][pool]") {
    ConnectionPool pool(1);
    auto held = pool.Acquire(In(100ms));
    REQUIRE(held.IsOk());

    CancellationToken token;
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(30ms);
        token.Cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    auto waiting = pool.Acquire(In(5000ms), token);
    canceller.join();
    REQUIRE(waiting.IsErr());
    CHECK(waiting.Error().category == ErrorCategory::Timeout);
    CHECK(std::chrono::steady_clock::now() - start < 2000ms);
}

TEST_CASE("ConnectionPool: Close wakes waiters and refuses new leases", "[backend][pool]") {
    ConnectionPool pool(1);
    auto held = pool.Acquire(In(100ms));
    REQUIRE(held.IsOk());

    std::thread closer([&pool] {
        std::this_thread::sleep_for(30ms);
        pool.Close();
    });
    auto waiting = pool.Acquire(In(5000ms));
    closer.join();
    REQUIRE(waiting.IsErr());
    CHECK(waiting.Error().category == ErrorCategory::ClientClosed);

    CHECK(pool.IsClosed());
    CHECK_FALSE(pool.Close());
    CHECK(pool.Acquire(In(100ms)).Error().category == ErrorCategory::ClientClosed);
}

TEST_CASE("ConnectionPool: concurrent holders never exceed capacity", "[backend][pool]") {
    ConnectionPool pool(3);
    std::atomic<int> current{0};
    std::atomic<int> observed_max{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&] {
            auto lease = pool.Acquire(In(5000ms));
            if (lease.IsErr()) {
                ++failures;
                return;
            }
            int now = ++current;
            int prev = observed_max.load();
            while (now > prev && !observed_max.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(10ms);
            --current;
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    CHECK(failures == 0);
    CHECK(observed_max <= 3);
    CHECK(pool.PeakInFlight() <= 3);
    CHECK(pool.InFlight() == 0);
}
