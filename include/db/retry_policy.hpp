#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <string_view>

namespace steadfast {

/**
 * @brief SQLSTATE worth retrying: serialization failure, deadlock,
 * admin/crash shutdown, connection failures, resource exhaustion
 */
[[nodiscard]] bool is_transient_sqlstate(std::string_view sqlstate);

/**
 * @brief Error text that points at a transient network problem
 * (refused/reset/unresolvable connection, expired timeout); case-insensitive
 */
[[nodiscard]] bool is_transient_message(std::string_view message);

/**
 * @brief Connection-level failure (SQLSTATE class 08 or a network message)
 *
 * These feed the store's consecutive-failure counter.
 */
[[nodiscard]] bool is_connection_error(const std::exception& e);

/**
 * @brief Exponential backoff with ±25% jitter for transient database errors
 *
 * delay(k) = min(base·2^k + base·2^k·0.25·(2r - 1), max_delay), r ∈ [0, 1)
 */
class RetryPolicy {
public:
    /// Returns r ∈ [0, 1); tests inject fixed values
    using JitterSource = std::function<double()>;

    explicit RetryPolicy(RetryConfig config = {}, JitterSource jitter = {});

    [[nodiscard]] bool is_transient(const std::exception& e) const;

    /**
     * @brief Delay before retry number attempt + 1 (attempt counts from 0)
     */
    [[nodiscard]] std::chrono::milliseconds delay_for(uint32_t attempt) const;

    [[nodiscard]] const RetryConfig& config() const { return config_; }

private:
    RetryConfig config_;
    JitterSource jitter_;
};

} // namespace steadfast
