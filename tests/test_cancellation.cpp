#include <catch2/catch.hpp>
#include "cancellation.hpp"
#include "error.hpp"
#include <chrono>
#include <thread>

using namespace switchyard;
using namespace std::chrono_literals;

TEST_CASE("CancellationToken: starts uncancelled", "[cancellation]") {
    CancellationToken token;
    REQUIRE_FALSE(token.cancelled());
    REQUIRE_NOTHROW(token.throw_if_cancelled("work"));
}

TEST_CASE("CancellationToken: copies share the flag", "[cancellation]") {
    CancellationToken token;
    CancellationToken copy = token;
    copy.cancel();
    REQUIRE(token.cancelled());
}

TEST_CASE("CancellationToken: parent cancellation reaches children", "[cancellation]") {
    CancellationToken parent;
    CancellationToken child = parent.child();
    CancellationToken grandchild = child.child();
    parent.cancel();
    REQUIRE(child.cancelled());
    REQUIRE(grandchild.cancelled());
}

TEST_CASE("CancellationToken: child cancellation stays local", "[cancellation]") {
    CancellationToken parent;
    CancellationToken a = parent.child();
    CancellationToken b = parent.child();
    a.cancel();
    REQUIRE(a.cancelled());
    REQUIRE_FALSE(b.cancelled());
    REQUIRE_FALSE(parent.cancelled());
}

TEST_CASE("CancellationToken: throw_if_cancelled raises Cancelled", "[cancellation]") {
    CancellationToken token;
    token.cancel();
    try {
        token.throw_if_cancelled("Inference");
        FAIL("expected throw");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::Cancelled);
        REQUIRE(e.message() == "Inference was cancelled");
    }
}

TEST_CASE("CancellationToken: wait_for sleeps the full duration", "[cancellation]") {
    CancellationToken token;
    auto start = std::chrono::steady_clock::now();
    REQUIRE(token.wait_for(30ms));
    REQUIRE(std::chrono::steady_clock::now() - start >= 30ms);
}

TEST_CASE("CancellationToken: wait_for wakes early on cancel", "[cancellation]") {
    CancellationToken token;
    std::thread canceller([token] {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    bool completed = token.child().wait_for(10s);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();
    REQUIRE_FALSE(completed);
    REQUIRE(elapsed < 5s);
}
