#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

using namespace steadfast;
using namespace std::chrono_literals;

TEST_CASE("ConfigValidation: empty document yields defaults", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.database.endpoint.host == "localhost");
    CHECK(cfg.database.endpoint.port == 5432);
    CHECK(cfg.database.min_connections == 2);
    CHECK(cfg.database.max_connections == 15);
    CHECK(cfg.database.max_connection_failures == 3);
    CHECK_FALSE(cfg.database.replica.has_value());
    CHECK(cfg.retry.max_retries == 3);
    CHECK(cfg.retry.base_delay == 1000ms);
    CHECK(cfg.retry.max_delay == 10000ms);
    CHECK(cfg.pool_monitor.enabled);
    CHECK(cfg.degradation.max_queue_size == 1000);
    CHECK(cfg.circuit_breakers.empty());
}

TEST_CASE("ConfigValidation: full document is parsed", "[config][validation]") {
    const std::string toml = R"(
[logging]
level = "debug"

[database]
host = "db.internal"
port = 6432
user = "bot"
password = "pw"
database = "shoukaku"
min_connections = 1
max_connections = 8
idle_timeout_ms = 15000
connection_timeout_ms = 3000
query_timeout_ms = 20000
acquire_timeout_ms = 2000
max_connection_failures = 5

[database.replica]
host = "replica.internal"
max_connections = 10

[retry]
max_retries = 5
base_delay_ms = 200
max_delay_ms = 4000

[pool_monitor]
enabled = false
interval_ms = 5000
utilization_warn_ratio = 0.9

[degradation]
max_queue_size = 50

[circuit_breakers.lavalink]
failure_threshold = 2
reset_timeout_ms = 1000

[circuit_breakers.weather]
enabled = false
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.database.endpoint.host == "db.internal");
    CHECK(cfg.database.endpoint.port == 6432);
    CHECK(cfg.database.endpoint.database == "shoukaku");
    CHECK(cfg.database.min_connections == 1);
    CHECK(cfg.database.max_connections == 8);
    CHECK(cfg.database.idle_timeout == 15000ms);
    CHECK(cfg.database.connection_timeout == 3000ms);
    CHECK(cfg.database.query_timeout == 20000ms);
    CHECK(cfg.database.acquire_timeout == 2000ms);
    CHECK(cfg.database.max_connection_failures == 5);

    REQUIRE(cfg.database.replica.has_value());
    CHECK(cfg.database.replica->endpoint.host == "replica.internal");
    // Unset replica fields inherit from the primary
    CHECK(cfg.database.replica->endpoint.port == 6432);
    CHECK(cfg.database.replica->endpoint.user == "bot");
    CHECK(cfg.database.replica->endpoint.password == "pw");
    CHECK(cfg.database.replica->min_connections == 2);
    CHECK(cfg.database.replica->max_connections == 10);

    CHECK(cfg.retry.max_retries == 5);
    CHECK(cfg.retry.base_delay == 200ms);
    CHECK(cfg.retry.max_delay == 4000ms);

    CHECK_FALSE(cfg.pool_monitor.enabled);
    CHECK(cfg.pool_monitor.interval == 5000ms);
    CHECK(cfg.pool_monitor.utilization_warn_ratio == 0.9);
    CHECK(cfg.degradation.max_queue_size == 50);

    REQUIRE(cfg.circuit_breakers.size() == 2);
    const auto& lavalink = cfg.circuit_breakers.at("lavalink");
    CHECK(lavalink.failure_threshold == std::optional<uint32_t>(2));
    CHECK(lavalink.reset_timeout == std::optional<std::chrono::milliseconds>(1000ms));
    CHECK_FALSE(lavalink.success_threshold.has_value());
    CHECK_FALSE(lavalink.enabled.has_value());
    CHECK(cfg.circuit_breakers.at("weather").enabled == std::optional<bool>(false));
}

TEST_CASE("ConfigValidation: replica without a host is ignored", "[config][validation]") {
    const std::string toml = R"(
[database.replica]
port = 5433
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK_FALSE(result.config.database.replica.has_value());
}

TEST_CASE("ConfigValidation: min > max connections fails", "[config][validation]") {
    const std::string toml = R"(
[database]
min_connections = 10
max_connections = 5
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("database.min_connections (10) > max_connections (5)")
          != std::string::npos);
}

TEST_CASE("ConfigValidation: zero max connections fails", "[config][validation]") {
    const std::string toml = R"(
[database]
min_connections = 0
max_connections = 0
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("database.max_connections must be > 0") != std::string::npos);
}

TEST_CASE("ConfigValidation: replica pool bounds are checked", "[config][validation]") {
    const std::string toml = R"(
[database.replica]
host = "replica"
min_connections = 4
max_connections = 3
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("database.replica.min_connections") != std::string::npos);
}

TEST_CASE("ConfigValidation: port out of range fails", "[config][validation]") {
    const std::string toml = R"(
[database]
port = 70000
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("database.port must be 1-65535, got 70000") != std::string::npos);
}

TEST_CASE("ConfigValidation: negative counts are rejected", "[config][validation]") {
    const std::string toml = R"(
[retry]
max_retries = -1
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("retry.max_retries must not be negative") != std::string::npos);
}

TEST_CASE("ConfigValidation: base delay above max delay fails", "[config][validation]") {
    const std::string toml = R"(
[retry]
base_delay_ms = 5000
max_delay_ms = 1000
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("retry.base_delay_ms (5000) > max_delay_ms (1000)") != std::string::npos);
}

TEST_CASE("ConfigValidation: circuit breaker zero threshold fails", "[config][validation]") {
    const std::string toml = R"(
[circuit_breakers.discord]
failure_threshold = 0
timeout_ms = 0
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("circuit_breakers.discord.failure_threshold must be > 0")
          != std::string::npos);
    CHECK(result.error_message.find("circuit_breakers.discord.timeout_ms must be > 0")
          != std::string::npos);
}

TEST_CASE("ConfigValidation: unknown log level fails", "[config][validation]") {
    const std::string toml = R"(
[logging]
level = "verbose"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("logging.level 'verbose'") != std::string::npos);
}

TEST_CASE("ConfigValidation: warn ratio only checked when monitoring", "[config][validation]") {
    const std::string bad = R"(
[pool_monitor]
utilization_warn_ratio = 1.5
)";
    CHECK_FALSE(ConfigLoader::load_from_string(bad).success);

    const std::string disabled = R"(
[pool_monitor]
enabled = false
utilization_warn_ratio = 1.5
)";
    CHECK(ConfigLoader::load_from_string(disabled).success);
}

TEST_CASE("ConfigValidation: zero queue size fails", "[config][validation]") {
    const std::string toml = R"(
[degradation]
max_queue_size = 0
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("degradation.max_queue_size must be > 0") != std::string::npos);
}

TEST_CASE("ConfigValidation: multiple errors are reported together", "[config][validation]") {
    const std::string toml = R"(
[database]
max_connection_failures = 0

[degradation]
max_queue_size = 0
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Config validation failed:"));
    CHECK(result.error_message.find("max_connection_failures") != std::string::npos);
    CHECK(result.error_message.find("max_queue_size") != std::string::npos);
}

TEST_CASE("ConfigValidation: malformed TOML is a parse error", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[database\nhost = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config:"));
}

TEST_CASE("ConfigValidation: missing file is a load error", "[config][validation]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/steadfast.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config:"));
}
