#pragma once

#include "config/config_types.hpp"
#include "db/iconnection_pool.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace steadfast {

/**
 * @brief One sampling of a pool's occupancy
 */
struct PoolSample {
    std::string pool;
    size_t total = 0;
    size_t idle = 0;
    size_t active = 0;
    size_t waiting = 0;
    double utilization = 0.0;       // active / max(total, 1)
    bool high_utilization = false;
    bool exhausted = false;         // callers were waiting for a connection
};

/**
 * @brief Periodic pool occupancy logger
 *
 * Every interval, samples each pool: utilization above the warn ratio logs
 * a warning, any waiting caller logs an exhaustion error.
 *
 * Runs on a single std::jthread with stop-token aware sleep.
 */
class PoolMonitor {
public:
    PoolMonitor(std::vector<std::shared_ptr<IConnectionPool>> pools, PoolMonitorConfig config);
    ~PoolMonitor();

    PoolMonitor(const PoolMonitor&) = delete;
    PoolMonitor& operator=(const PoolMonitor&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }

    /**
     * @brief Sample and log every pool once
     */
    std::vector<PoolSample> sample_once() const;

    [[nodiscard]] static PoolSample evaluate(const std::string& pool, const PoolStats& stats,
                                             double warn_ratio);

private:
    void monitor_loop(std::stop_token stop);

    std::vector<std::shared_ptr<IConnectionPool>> pools_;
    PoolMonitorConfig config_;

    std::atomic<bool> running_{false};
    std::jthread monitor_thread_;
};

} // namespace steadfast
