#include "db/retry_policy.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <random>
#include <string>

namespace steadfast {

namespace {

constexpr std::array<std::string_view, 13> kTransientSqlStates = {
    "40001",    // serialization_failure
    "40P01",    // deadlock_detected
    "57P01",    // admin_shutdown
    "57P02",    // crash_shutdown
    "57P03",    // cannot_connect_now
    "08006",    // connection_failure
    "08001",    // sqlclient_unable_to_establish_sqlconnection
    "08003",    // connection_does_not_exist
    "08004",    // sqlserver_rejected_establishment_of_sqlconnection
    "53000",    // insufficient_resources
    "53100",    // disk_full
    "53200",    // out_of_memory
    "53300",    // too_many_connections
};

constexpr std::array<std::string_view, 7> kTransientMessages = {
    "econnrefused",
    "enotfound",
    "etimedout",
    "econnreset",
    "connection terminated",
    "connection refused",
    "timeout expired",
};

constexpr std::array<std::string_view, 4> kConnectionMessages = {
    "econnrefused",
    "enotfound",
    "etimedout",
    "connection_timeout",
};

double default_jitter() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}

bool contains_any(const std::string& haystack, const auto& needles) {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view n) {
        return haystack.find(n) != std::string::npos;
    });
}

} // anonymous namespace

bool is_transient_sqlstate(std::string_view sqlstate) {
    return std::find(kTransientSqlStates.begin(), kTransientSqlStates.end(), sqlstate)
        != kTransientSqlStates.end();
}

bool is_transient_message(std::string_view message) {
    return contains_any(utils::to_lower(message), kTransientMessages);
}

bool is_connection_error(const std::exception& e) {
    if (const auto* db = dynamic_cast<const DatabaseError*>(&e)) {
        if (db->sqlstate().starts_with("08")) return true;
    }
    const auto lower = utils::to_lower(e.what());
    return contains_any(lower, kConnectionMessages) || lower.find("connection refused") != std::string::npos;
}

RetryPolicy::RetryPolicy(RetryConfig config, JitterSource jitter)
    : config_(config),
      jitter_(jitter ? std::move(jitter) : JitterSource(default_jitter)) {}

bool RetryPolicy::is_transient(const std::exception& e) const {
    if (const auto* db = dynamic_cast<const DatabaseError*>(&e)) {
        if (is_transient_sqlstate(db->sqlstate())) return true;
    }
    return is_transient_message(e.what());
}

std::chrono::milliseconds RetryPolicy::delay_for(uint32_t attempt) const {
    const double base = static_cast<double>(config_.base_delay.count());
    const double max = static_cast<double>(config_.max_delay.count());

    // Exponent clamped; max_delay caps the result long before 2^30
    const double exponential = base * std::pow(2.0, static_cast<double>(std::min<uint32_t>(attempt, 30)));
    const double jitter = exponential * 0.25 * (jitter_() * 2.0 - 1.0);
    const double delay = std::clamp(exponential + jitter, 0.0, max);

    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay)));
}

} // namespace steadfast
