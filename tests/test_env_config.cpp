#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace steadfast;
using namespace std::chrono_literals;

TEST_CASE("Env expansion: expand env var in database password", "[config][env]") {
    ::setenv("STEADFAST_DB_PASSWORD", "hunter2-prod", 1);

    const std::string toml = R"(
[database]
host = "localhost"
password = "${STEADFAST_DB_PASSWORD}"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.database.endpoint.password == "hunter2-prod");

    ::unsetenv("STEADFAST_DB_PASSWORD");
}

TEST_CASE("Env expansion: unset variable becomes an empty string", "[config][env]") {
    ::unsetenv("STEADFAST_UNSET_PASSWORD");

    const std::string toml = R"(
[database]
user = "bot${STEADFAST_UNSET_PASSWORD}"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.database.endpoint.user == "bot");
}

TEST_CASE("Env expansion: unterminated placeholder fails the load", "[config][env]") {
    const std::string toml = R"(
[database]
password = "${UNCLOSED"
)";

    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config:"));
    CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
}

TEST_CASE("Env expansion: several placeholders in one value", "[config][env]") {
    ::setenv("TEST_DB_NAME", "shoukaku", 1);
    ::setenv("TEST_DB_ENV", "prod", 1);

    const std::string toml = R"(
[database]
database = "${TEST_DB_NAME}_${TEST_DB_ENV}"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.database.endpoint.database == "shoukaku_prod");

    ::unsetenv("TEST_DB_NAME");
    ::unsetenv("TEST_DB_ENV");
}

TEST_CASE("Env expansion: expansion reaches nested tables", "[config][env]") {
    ::setenv("TEST_REPLICA_HOST", "replica.internal", 1);

    const std::string toml = R"(
[database.replica]
host = "${TEST_REPLICA_HOST}"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    REQUIRE(result.config.database.replica.has_value());
    CHECK(result.config.database.replica->endpoint.host == "replica.internal");

    ::unsetenv("TEST_REPLICA_HOST");
}

TEST_CASE("Env expansion: replica host from an unset variable disables the replica", "[config][env]") {
    ::unsetenv("TEST_UNSET_REPLICA_HOST");

    const std::string toml = R"(
[database.replica]
host = "${TEST_UNSET_REPLICA_HOST}"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK_FALSE(result.config.database.replica.has_value());
}

TEST_CASE("Env expansion: numeric values are left alone", "[config][env]") {
    const std::string toml = R"(
[database]
min_connections = 4
max_connections = 24
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.database.min_connections == 4);
    CHECK(result.config.database.max_connections == 24);
}

TEST_CASE("Env expansion: endpoint renders a libpq connection string", "[config][env]") {
    EndpointConfig endpoint;
    endpoint.host = "db.internal";
    endpoint.port = 6432;
    endpoint.user = "bot";
    endpoint.password = R"(it's\secret)";
    endpoint.database = "shoukaku";

    CHECK(endpoint.to_connection_string(3500ms) ==
          R"(host='db.internal' port=6432 user='bot' password='it\'s\\secret' dbname='shoukaku' connect_timeout=3)");
}

TEST_CASE("Env expansion: connection string omits empty fields and floors the timeout", "[config][env]") {
    EndpointConfig endpoint;
    CHECK(endpoint.to_connection_string(200ms) == "host='localhost' port=5432 connect_timeout=1");
}
