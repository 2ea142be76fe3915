#include "db/pool_monitor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace steadfast {

PoolMonitor::PoolMonitor(std::vector<std::shared_ptr<IConnectionPool>> pools, PoolMonitorConfig config)
    : pools_(std::move(pools)), config_(config) {}

PoolMonitor::~PoolMonitor() {
    stop();
}

void PoolMonitor::start() {
    if (running_.load() || !config_.enabled) return;
    running_.store(true);
    monitor_thread_ = std::jthread([this](std::stop_token stop) {
        monitor_loop(std::move(stop));
    });
    utils::log::debug(std::format("[PoolMonitor] Started: sampling {} pool(s) every {}ms",
        pools_.size(), config_.interval.count()));
}

void PoolMonitor::stop() {
    if (!running_.load()) return;
    running_.store(false);
    if (monitor_thread_.joinable()) {
        monitor_thread_.request_stop();
        monitor_thread_.join();
    }
}

PoolSample PoolMonitor::evaluate(const std::string& pool, const PoolStats& stats, double warn_ratio) {
    PoolSample s;
    s.pool = pool;
    s.total = stats.total_connections;
    s.idle = stats.idle_connections;
    s.active = stats.active_connections;
    s.waiting = stats.waiting_requests;
    s.utilization = static_cast<double>(s.active) / static_cast<double>(std::max<size_t>(s.total, 1));
    s.high_utilization = s.utilization > warn_ratio;
    s.exhausted = s.waiting > 0;
    return s;
}

std::vector<PoolSample> PoolMonitor::sample_once() const {
    std::vector<PoolSample> samples;
    samples.reserve(pools_.size());

    for (const auto& pool : pools_) {
        if (!pool) continue;
        auto s = evaluate(pool->name(), pool->get_stats(), config_.utilization_warn_ratio);

        if (s.high_utilization) {
            utils::log::warn(std::format(
                "[PoolMonitor] {} pool utilization high: {:.1f}% ({}/{} active, {} idle)",
                s.pool, s.utilization * 100.0, s.active, s.total, s.idle));
        }
        if (s.exhausted) {
            utils::log::error(std::format(
                "[PoolMonitor] {} pool exhausted: {} request(s) waiting for a connection",
                s.pool, s.waiting));
        }
        samples.push_back(std::move(s));
    }
    return samples;
}

void PoolMonitor::monitor_loop(std::stop_token stop) {
    const auto slices = std::max<int64_t>(config_.interval.count() / 100, 1);
    while (!stop.stop_requested()) {
        // Sleep in 100ms increments for responsive shutdown
        for (int64_t i = 0; i < slices && !stop.stop_requested(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }
        if (stop.stop_requested()) break;

        sample_once();
    }
}

} // namespace steadfast
