#include <catch2/catch_test_macros.hpp>
#include "cancel_registry.hpp"
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace ollie;

// ── register / cancel / unregister ───────────────────────────────

TEST_CASE("CancellationRegistry: new token starts uncancelled", "[cancel_registry]") {
    CancellationRegistry registry;
    auto token = registry.register_pull("p1");
    REQUIRE(token != nullptr);
    REQUIRE_FALSE(token->load());
    REQUIRE(registry.contains("p1"));
    REQUIRE(registry.size() == 1);
}

TEST_CASE("CancellationRegistry: request_cancel sets the shared flag", "[cancel_registry]") {
    CancellationRegistry registry;
    auto token = registry.register_pull("p1");
    REQUIRE(registry.request_cancel("p1"));
    REQUIRE(token->load());
}

TEST_CASE("CancellationRegistry: request_cancel on unknown id reports not found",
          "[cancel_registry]") {
    CancellationRegistry registry;
    REQUIRE_FALSE(registry.request_cancel("missing"));
    registry.register_pull("p1");
    REQUIRE_FALSE(registry.request_cancel("p2"));
}

TEST_CASE("CancellationRegistry: cancel only affects its own pull", "[cancel_registry]") {
    CancellationRegistry registry;
    auto a = registry.register_pull("a");
    auto b = registry.register_pull("b");
    registry.request_cancel("a");
    REQUIRE(a->load());
    REQUIRE_FALSE(b->load());
}

TEST_CASE("CancellationRegistry: duplicate id is a logic error", "[cancel_registry]") {
    CancellationRegistry registry;
    auto first = registry.register_pull("dup");
    REQUIRE_THROWS_AS(registry.register_pull("dup"), std::logic_error);
    // Original entry untouched
    REQUIRE(registry.request_cancel("dup"));
    REQUIRE(first->load());
}

TEST_CASE("CancellationRegistry: unregister removes entry", "[cancel_registry]") {
    CancellationRegistry registry;
    registry.register_pull("p1");
    registry.unregister("p1");
    REQUIRE_FALSE(registry.contains("p1"));
    REQUIRE_FALSE(registry.request_cancel("p1"));
    registry.unregister("p1"); // no-op
    REQUIRE(registry.size() == 0);
}

TEST_CASE("CancellationRegistry: reused id gets a fresh flag", "[cancel_registry]") {
    CancellationRegistry registry;
    auto old_token = registry.register_pull("same");
    registry.request_cancel("same");
    registry.unregister("same");

    auto new_token = registry.register_pull("same");
    REQUIRE(old_token->load());
    REQUIRE_FALSE(new_token->load());
}

TEST_CASE("CancellationRegistry: cancel_all sets every flag", "[cancel_registry]") {
    CancellationRegistry registry;
    auto a = registry.register_pull("a");
    auto b = registry.register_pull("b");
    REQUIRE(registry.cancel_all() == 2);
    REQUIRE(a->load());
    REQUIRE(b->load());
}

// ── Guard ────────────────────────────────────────────────────────

TEST_CASE("CancellationRegistry::Guard: unregisters on scope exit", "[cancel_registry]") {
    CancellationRegistry registry;
    {
        auto guard = registry.register_guarded("g");
        REQUIRE(registry.contains("g"));
        REQUIRE(guard->id() == "g");
        REQUIRE_FALSE(guard->cancelled());
        registry.request_cancel("g");
        REQUIRE(guard->cancelled());
    }
    REQUIRE_FALSE(registry.contains("g"));
}

TEST_CASE("CancellationRegistry::Guard: unregisters during exception unwinding",
          "[cancel_registry]") {
    CancellationRegistry registry;
    try {
        auto guard = registry.register_guarded("boom");
        throw std::runtime_error("fail");
    } catch (const std::runtime_error&) {
    }
    REQUIRE_FALSE(registry.contains("boom"));
}

// ── Concurrency ──────────────────────────────────────────────────

TEST_CASE("CancellationRegistry: concurrent register/cancel/unregister", "[cancel_registry]") {
    CancellationRegistry registry;
    constexpr int kThreads = 8;
    constexpr int kIterations = 500;

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&registry, &failures, t]() {
            for (int i = 0; i < kIterations; ++i) {
                std::string id = "t" + std::to_string(t) + "-" + std::to_string(i);
                auto token = registry.register_pull(id);
                registry.request_cancel(id);
                if (!token->load()) failures++;
                registry.unregister(id);
            }
        });
    }
    // Concurrent cancels for ids that may or may not exist
    std::thread canceller([&registry]() {
        for (int i = 0; i < kIterations; ++i)
            registry.request_cancel("t0-" + std::to_string(i));
    });

    for (auto& th : threads) th.join();
    canceller.join();
    REQUIRE(failures.load() == 0);
    REQUIRE(registry.size() == 0);
}
