#pragma once

#include "config/config_types.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace steadfast {

/**
 * @brief Loads ResilienceConfig from TOML
 *
 * Sections: [logging], [database], [database.replica], [retry],
 * [pool_monitor], [degradation], [circuit_breakers.<name>].
 * String values may reference ${ENV_VAR}; unset variables expand to "".
 * Missing keys keep their defaults.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        ResilienceConfig config;

        static LoadResult ok(ResilienceConfig cfg) {
            return {.success = true, .error_message = {}, .config = std::move(cfg)};
        }

        static LoadResult error(std::string message) {
            return {.success = false, .error_message = std::move(message), .config = {}};
        }
    };

    /// Reads and parses config_path (e.g. config/steadfast.toml)
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Semantic checks on a parsed config
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const ResilienceConfig& config);

private:
    static ResilienceConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(ResilienceConfig config);

    // One extractor per top-level section

    static LoggingConfig extract_logging(const toml::table& root);
    static DatabaseConfig extract_database(const toml::table& root);
    static RetryConfig extract_retry(const toml::table& root);
    static PoolMonitorConfig extract_pool_monitor(const toml::table& root);
    static DegradationConfig extract_degradation(const toml::table& root);
    static std::unordered_map<std::string, CircuitBreakerSettings>
        extract_circuit_breakers(const toml::table& root);
};

} // namespace steadfast
