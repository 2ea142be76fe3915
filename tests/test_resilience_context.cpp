#include <catch2/catch_test_macros.hpp>
#include "core/resilience_context.hpp"

using namespace steadfast;
using namespace std::chrono_literals;

TEST_CASE("ResilienceContext: initialize registers breakers and services", "[context]") {
    ResilienceContext ctx;
    CHECK_FALSE(ctx.is_initialized());

    ctx.initialize();
    CHECK(ctx.is_initialized());
    CHECK(ctx.breakers().size() == 12);
    for (const auto* service : {"redis", "database", "lavalink", "discord"}) {
        INFO(service);
        CHECK(ctx.coordinator().get_service_state(service) == ServiceState::HEALTHY);
    }

    // Idempotent
    ctx.initialize();
    CHECK(ctx.breakers().size() == 12);
}

TEST_CASE("ResilienceContext: config overrides reach the breakers", "[context][config]") {
    ResilienceConfig config;
    config.circuit_breakers["database"].failure_threshold = 1;
    config.circuit_breakers["database"].reset_timeout = 2000ms;

    ResilienceContext ctx(config);
    ctx.initialize();

    const auto database = ctx.breakers().get("database");
    REQUIRE(database != nullptr);
    CHECK(database->config().failure_threshold == 1);
    CHECK(database->config().reset_timeout == 2000ms);
    CHECK(database->config().success_threshold == 2);
}

TEST_CASE("ResilienceContext: queue size comes from config", "[context][config]") {
    ResilienceConfig config;
    config.degradation.max_queue_size = 2;

    ResilienceContext ctx(config);
    ctx.initialize();
    CHECK(ctx.coordinator().max_queue_size() == 2);

    for (int i = 0; i < 5; ++i) {
        ctx.coordinator().queue_write("database", "insert", {{"n", i}});
    }
    CHECK(ctx.coordinator().queue_size() == 2);
}

TEST_CASE("ResilienceContext: contexts are independent", "[context]") {
    ResilienceContext a;
    ResilienceContext b;
    a.initialize();
    b.initialize();

    a.breakers().get("steam")->trip();
    a.coordinator().mark_unavailable("redis");

    CHECK(b.breakers().get("steam")->is_closed());
    CHECK(b.coordinator().get_service_state("redis") == ServiceState::HEALTHY);
}

TEST_CASE("ResilienceContext: shutdown and reset", "[context]") {
    ResilienceContext ctx;
    ctx.initialize();
    ctx.breakers().get("google")->trip();
    ctx.coordinator().mark_degraded("lavalink");
    ctx.coordinator().queue_write("database", "delete", {{"table", "snipes"}});

    ctx.shutdown();
    CHECK_FALSE(ctx.is_initialized());
    CHECK(ctx.breakers().size() == 0);
    CHECK_FALSE(ctx.coordinator().get_service_state("lavalink").has_value());
    CHECK(ctx.coordinator().queue_size() == 0);

    ctx.reset();
    CHECK(ctx.is_initialized());
    CHECK(ctx.breakers().get("google")->is_closed());
    CHECK(ctx.coordinator().get_service_state("lavalink") == ServiceState::HEALTHY);
    CHECK(ctx.coordinator().level() == DegradationLevel::NORMAL);
}
