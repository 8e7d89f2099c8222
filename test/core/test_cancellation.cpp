#include <catch2/catch_test_macros.hpp>

#include <op_mcp/core/cancellation.hpp>

#include <chrono>
#include <thread>

using namespace op_mcp;
using namespace std::chrono_literals;

TEST_CASE("CancellationToken: copies share state", "[core][cancel]") {
    CancellationToken token;
    auto copy = token;
    CHECK_FALSE(copy.IsCancelled());
    token.Cancel();
    CHECK(copy.IsCancelled());
}

TEST_CASE("CancellationToken: cancel cascades to children only", "[core][cancel]") {
    CancellationToken parent;
    auto child = parent.MakeChild();
    auto grandchild = child.MakeChild();

    child.Cancel();
    CHECK(grandchild.IsCancelled());
    CHECK_FALSE(parent.IsCancelled());

    auto other = parent.MakeChild();
    parent.Cancel();
    CHECK(other.IsCancelled());
}

TEST_CASE("CancellationToken: child of a cancelled token starts cancelled", "[core][cancel]") {
    CancellationToken parent;
    parent.Cancel();
    CHECK(parent.MakeChild().IsCancelled());
}

TEST_CASE("CancellationToken: linked token follows either source", "[core][cancel]") {
    CancellationToken a;
    CancellationToken b;
    auto from_a = a.LinkedWith(b);
    auto from_b = a.LinkedWith(b);

    b.Cancel();
    CHECK(from_b.IsCancelled());
    CHECK(from_a.IsCancelled());
    CHECK_FALSE(a.IsCancelled());

    CancellationToken c;
    auto linked = c.LinkedWith(CancellationToken{});
    c.Cancel();
    CHECK(linked.IsCancelled());
}

TEST_CASE("CancellationToken: linking to a cancelled token starts cancelled", "[core][cancel]") {
    CancellationToken live;
    CancellationToken dead;
    dead.Cancel();
    CHECK(live.LinkedWith(dead).IsCancelled());
    CHECK(dead.LinkedWith(live).IsCancelled());
    CHECK_FALSE(live.IsCancelled());
}

TEST_CASE("CancellationToken: WaitFor times out without cancel", "[core][cancel]") {
    CancellationToken token;
    const auto start = std::chrono::steady_clock::now();
    CHECK_FALSE(token.WaitFor(30ms));
    CHECK(std::chrono::steady_clock::now() - start >= 25ms);
}

TEST_CASE("CancellationToken: WaitFor wakes on cancel from another thread", "[core][cancel]") {
    CancellationToken token;
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(20ms);
        token.Cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    CHECK(token.WaitFor(5000ms));
    CHECK(std::chrono::steady_clock::now() - start < 2000ms);
    canceller.join();
}
