#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/resilience_context.hpp"
#include "core/status_json.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/resilient_data_store.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <iostream>
#include <memory>

using namespace steadfast;

// Exit codes: 0 healthy, 1 configuration or fatal error, 2 degraded beyond use
int main(int argc, char* argv[]) {
    try {
        std::string config_file = "config/steadfast.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& cfg = config_result.config;

        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::info("[2/4] Initializing circuit breakers and degradation coordinator");
        ResilienceContext context(cfg);
        context.initialize();

        utils::log::info(std::format("[3/4] Connecting to PostgreSQL at {}:{}",
            cfg.database.endpoint.host, cfg.database.endpoint.port));

        StoreOptions store_options{
            .database = cfg.database,
            .retry = cfg.retry,
            .pool_monitor = cfg.pool_monitor,
        };
        ResilientDataStore store(context.coordinator(), store_options,
                                 std::make_shared<PgConnectionFactory>());

        nlohmann::json report;
        try {
            // Connection failures are reported in the document, not fatal
            store.initialize();
            report["database"]["primaryHealthy"] = store.health_check();
            report["database"]["replicaHealthy"] = store.read_replica_health_check();
            report["database"]["pools"] = store.sample_pools();
        } catch (const ResilienceError& e) {
            utils::log::error(std::format("[PostgreSQL] {}", e.what()));
            context.coordinator().mark_unavailable("database", e.what());
            report["database"]["error"] = e.what();
        }

        utils::log::info("[4/4] Collecting health");
        const auto health = context.coordinator().get_health();
        report["database"]["status"] = store.get_status();
        report["system"] = health;
        report["circuitBreakers"] = context.breakers().get_health();
        report["circuitBreakerSummary"] = context.breakers().get_summary();

        std::cout << report.dump(2) << std::endl;

        store.close();
        context.shutdown();
        return health.healthy ? 0 : 2;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
