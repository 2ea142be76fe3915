#include <catch2/catch_test_macros.hpp>
#include "core/status_json.hpp"

#include <stdexcept>

using namespace steadfast;
using namespace std::chrono_literals;
using json = nlohmann::json;

TEST_CASE("StatusJson: breaker metrics", "[status_json]") {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = 1;
    cfg.timeout = 0ms;
    CircuitBreaker cb("pixiv", cfg);

    cb.execute([] { return 1; });
    try {
        cb.execute([]() -> int { throw std::runtime_error("503"); });
    } catch (const std::runtime_error&) {
    }

    const json j = cb.get_metrics();
    CHECK(j["name"] == "pixiv");
    CHECK(j["state"] == "OPEN");
    CHECK(j["failureCount"] == 1);
    CHECK(j["totalRequests"] == 2);
    CHECK(j["successfulRequests"] == 1);
    CHECK(j["failedRequests"] == 1);
    CHECK(j["successRate"] == "50.00%");
    CHECK(j["lastFailureTime"].is_string());
    CHECK(j["nextAttempt"].is_string());

    REQUIRE(j["stateChanges"].size() == 1);
    CHECK(j["stateChanges"][0]["from"] == "CLOSED");
    CHECK(j["stateChanges"][0]["to"] == "OPEN");
}

TEST_CASE("StatusJson: absent timestamps are null", "[status_json]") {
    CircuitBreaker cb("fresh", CircuitBreaker::Config{});

    const json metrics = cb.get_metrics();
    CHECK(metrics["lastFailureTime"].is_null());
    CHECK(metrics["nextAttempt"].is_null());
    CHECK(metrics["successRate"] == "N/A");

    const json health = cb.get_health();
    CHECK(health["status"] == "healthy");
    CHECK(health["lastFailure"].is_null());
}

TEST_CASE("StatusJson: registry health and summary", "[status_json]") {
    CircuitBreakerRegistry registry;
    registry.initialize();
    registry.get("fandom")->trip();

    const json health = registry.get_health();
    CHECK(health["status"] == "unhealthy");
    CHECK(health["breakers"]["fandom"]["state"] == "OPEN");
    CHECK(health["breakers"]["steam"]["status"] == "healthy");

    const json summary = registry.get_summary();
    CHECK(summary == (json{{"total", 12}, {"closed", 11}, {"open", 1}, {"halfOpen", 0}}));
}

TEST_CASE("StatusJson: system status", "[status_json]") {
    DegradationCoordinator coordinator;
    coordinator.initialize();
    coordinator.mark_degraded("redis", "timeout");
    coordinator.queue_write("database", "insert", {{"table", "snipes"}});

    const json status = coordinator.get_status();
    CHECK(status["level"] == "DEGRADED");
    CHECK(status["queuedWrites"] == 1);
    CHECK(status["cacheEntries"] == 0);
    CHECK(status["services"]["redis"]["state"] == "DEGRADED");
    CHECK(status["services"]["redis"]["degradedSince"].is_string());
    CHECK(status["services"]["database"]["critical"] == true);
    CHECK(status["services"]["database"]["degradedSince"].is_null());

    const json health = coordinator.get_health();
    CHECK(health["healthy"] == true);
    CHECK(health["details"]["level"] == "DEGRADED");
}

TEST_CASE("StatusJson: database status", "[status_json]") {
    DatabaseStatus status;
    status.connected = true;
    status.state = "healthy";
    status.max_failures = 3;
    status.retry.max_retries = 4;

    json j = status;
    CHECK(j["connected"] == true);
    CHECK(j["readReplica"]["enabled"] == false);
    CHECK(j["readReplica"]["host"].is_null());
    CHECK(j["retryConfig"] == (json{{"maxRetries", 4}, {"baseDelayMs", 1000}, {"maxDelayMs", 10000}}));

    status.replica_enabled = true;
    status.replica_host = "replica.internal";
    j = status;
    CHECK(j["readReplica"]["host"] == "replica.internal");
}

TEST_CASE("StatusJson: pool sample", "[status_json]") {
    PoolStats stats;
    stats.total_connections = 4;
    stats.active_connections = 4;
    stats.waiting_requests = 2;

    const json j = PoolMonitor::evaluate("primary", stats, 0.8);
    CHECK(j["pool"] == "primary");
    CHECK(j["utilization"] == 1.0);
    CHECK(j["highUtilization"] == true);
    CHECK(j["exhausted"] == true);
    CHECK(j["waiting"] == 2);
}
