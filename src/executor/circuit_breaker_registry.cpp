#include "executor/circuit_breaker_registry.hpp"

namespace steadfast {

namespace {

using namespace std::chrono_literals;

CircuitBreaker::Config make_policy(uint32_t failure_threshold, uint32_t success_threshold,
                                   std::chrono::milliseconds timeout,
                                   std::chrono::milliseconds reset_timeout) {
    CircuitBreaker::Config cfg;
    cfg.failure_threshold = failure_threshold;
    cfg.success_threshold = success_threshold;
    cfg.timeout = timeout;
    cfg.reset_timeout = reset_timeout;
    return cfg;
}

CircuitBreaker::Fallback unavailable_fallback(std::string message, std::string code) {
    return [message = std::move(message), code = std::move(code)](const std::exception&) -> std::any {
        return FallbackResult{false, message, code};
    };
}

/**
 * @brief Chat-platform failure classifier: rate limits (HTTP 429) are expected
 * back-pressure, not an outage
 */
bool is_not_rate_limited(const std::exception& e) {
    if (const auto* http = dynamic_cast<const HttpStatusError*>(&e)) {
        return http->status() != 429;
    }
    return true;
}

void apply_settings(CircuitBreaker::Config& cfg, const CircuitBreakerSettings& s) {
    if (s.enabled) cfg.enabled = *s.enabled;
    if (s.failure_threshold) cfg.failure_threshold = *s.failure_threshold;
    if (s.success_threshold) cfg.success_threshold = *s.success_threshold;
    if (s.timeout) cfg.timeout = *s.timeout;
    if (s.reset_timeout) cfg.reset_timeout = *s.reset_timeout;
}

} // anonymous namespace

std::vector<std::pair<std::string, CircuitBreaker::Config>> default_breaker_policies() {
    std::vector<std::pair<std::string, CircuitBreaker::Config>> policies;

    // Music streaming node: searches can be slow, give it time to recover
    auto lavalink = make_policy(5, 2, 30s, 60s);
    lavalink.fallback = unavailable_fallback("Music service temporarily unavailable", "LAVALINK_UNAVAILABLE");
    policies.emplace_back("lavalink", std::move(lavalink));

    auto external = make_policy(3, 2, 10s, 30s);
    external.fallback = unavailable_fallback("External service temporarily unavailable", "API_UNAVAILABLE");
    policies.emplace_back("externalApi", std::move(external));

    auto database = make_policy(3, 2, 5s, 30s);
    database.fallback = unavailable_fallback("Database temporarily unavailable", "DB_UNAVAILABLE");
    policies.emplace_back("database", std::move(database));

    // Cache miss is acceptable: null fallback
    auto redis = make_policy(5, 3, 3s, 15s);
    redis.fallback = [](const std::exception&) -> std::any { return {}; };
    policies.emplace_back("redis", std::move(redis));

    // Higher threshold, rate limits never count
    auto discord = make_policy(10, 3, 15s, 30s);
    discord.is_failure = is_not_rate_limited;
    policies.emplace_back("discord", std::move(discord));

    auto anime = make_policy(3, 2, 10s, 30s);
    anime.fallback = unavailable_fallback("Anime service temporarily unavailable", "ANIME_API_UNAVAILABLE");
    policies.emplace_back("anime", std::move(anime));

    auto nsfw = make_policy(3, 2, 15s, 60s);
    nsfw.fallback = unavailable_fallback("Service temporarily unavailable", "NSFW_API_UNAVAILABLE");
    policies.emplace_back("nsfw", std::move(nsfw));

    auto google = make_policy(3, 2, 10s, 30s);
    google.fallback = unavailable_fallback("Search service temporarily unavailable", "SEARCH_API_UNAVAILABLE");
    policies.emplace_back("google", std::move(google));

    auto wikipedia = make_policy(3, 2, 8s, 30s);
    wikipedia.fallback = unavailable_fallback("Wikipedia service temporarily unavailable", "WIKIPEDIA_API_UNAVAILABLE");
    policies.emplace_back("wikipedia", std::move(wikipedia));

    auto pixiv = make_policy(3, 2, 15s, 60s);
    pixiv.fallback = unavailable_fallback("Pixiv service temporarily unavailable", "PIXIV_API_UNAVAILABLE");
    policies.emplace_back("pixiv", std::move(pixiv));

    auto fandom = make_policy(3, 2, 10s, 30s);
    fandom.fallback = unavailable_fallback("Fandom service temporarily unavailable", "FANDOM_API_UNAVAILABLE");
    policies.emplace_back("fandom", std::move(fandom));

    auto steam = make_policy(3, 2, 10s, 30s);
    steam.fallback = unavailable_fallback("Steam service temporarily unavailable", "STEAM_API_UNAVAILABLE");
    policies.emplace_back("steam", std::move(steam));

    return policies;
}

void CircuitBreakerRegistry::initialize(
    const std::unordered_map<std::string, CircuitBreakerSettings>& overrides) {
    {
        std::shared_lock lock(breakers_mutex_);
        if (initialized_) return;
    }

    for (auto& [name, cfg] : default_breaker_policies()) {
        const auto it = overrides.find(name);
        if (it != overrides.end()) {
            apply_settings(cfg, it->second);
        }
        register_breaker(name, std::move(cfg));
    }

    // Overrides naming a non-preset breaker register a fresh one
    for (const auto& [name, settings] : overrides) {
        if (get(name)) continue;
        CircuitBreaker::Config cfg;
        apply_settings(cfg, settings);
        register_breaker(name, std::move(cfg));
    }

    std::unique_lock lock(breakers_mutex_);
    initialized_ = true;
    utils::log::info(std::format(
        "[CircuitBreakerRegistry] Initialized {} circuit breakers", breakers_.size()));
}

bool CircuitBreakerRegistry::is_initialized() const {
    std::shared_lock lock(breakers_mutex_);
    return initialized_;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::register_breaker(
    const std::string& name, CircuitBreaker::Config config) {
    std::unique_lock lock(breakers_mutex_);
    auto [it, inserted] = breakers_.try_emplace(name, nullptr);
    if (!inserted) {
        utils::log::warn(std::format(
            "[CircuitBreakerRegistry] Breaker '{}' already exists, returning existing", name));
        return it->second;
    }

    it->second = std::make_shared<CircuitBreaker>(name, std::move(config));
    attach_observers(*it->second);
    return it->second;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(const std::string& name) const {
    std::shared_lock lock(breakers_mutex_);
    const auto it = breakers_.find(name);
    return it != breakers_.end() ? it->second : nullptr;
}

RegistryHealth CircuitBreakerRegistry::get_health() const {
    std::shared_lock lock(breakers_mutex_);

    RegistryHealth health;
    bool has_unhealthy = false;
    bool has_degraded = false;

    for (const auto& [name, breaker] : breakers_) {
        auto h = breaker->get_health();
        if (h.status == HealthStatus::UNHEALTHY) has_unhealthy = true;
        if (h.status == HealthStatus::DEGRADED) has_degraded = true;
        health.breakers.emplace(name, std::move(h));
    }

    if (has_unhealthy) health.status = HealthStatus::UNHEALTHY;
    else if (has_degraded) health.status = HealthStatus::DEGRADED;

    return health;
}

RegistrySummary CircuitBreakerRegistry::get_summary() const {
    std::shared_lock lock(breakers_mutex_);

    RegistrySummary summary;
    summary.total = breakers_.size();
    for (const auto& [name, breaker] : breakers_) {
        switch (breaker->get_state()) {
            case CircuitState::CLOSED:    ++summary.closed; break;
            case CircuitState::OPEN:      ++summary.open; break;
            case CircuitState::HALF_OPEN: ++summary.half_open; break;
        }
    }
    return summary;
}

std::map<std::string, CircuitBreakerMetrics> CircuitBreakerRegistry::get_metrics() const {
    std::shared_lock lock(breakers_mutex_);
    std::map<std::string, CircuitBreakerMetrics> result;
    for (const auto& [name, breaker] : breakers_) {
        result.emplace(name, breaker->get_metrics());
    }
    return result;
}

void CircuitBreakerRegistry::reset_all() {
    std::vector<std::shared_ptr<CircuitBreaker>> snapshot;
    {
        std::shared_lock lock(breakers_mutex_);
        snapshot.reserve(breakers_.size());
        for (const auto& [name, breaker] : breakers_) snapshot.push_back(breaker);
    }
    for (const auto& breaker : snapshot) {
        breaker->reset();
    }
    utils::log::info("[CircuitBreakerRegistry] All circuits reset");
}

void CircuitBreakerRegistry::reset_all_metrics() {
    std::shared_lock lock(breakers_mutex_);
    for (const auto& [name, breaker] : breakers_) {
        breaker->reset_metrics();
    }
}

void CircuitBreakerRegistry::shutdown() {
    std::unique_lock lock(breakers_mutex_);
    for (const auto& [name, breaker] : breakers_) {
        breaker->set_on_state_change({});
        breaker->set_on_reject({});
    }
    breakers_.clear();
    initialized_ = false;
}

size_t CircuitBreakerRegistry::size() const {
    std::shared_lock lock(breakers_mutex_);
    return breakers_.size();
}

void CircuitBreakerRegistry::set_on_state_change(std::function<void(const StateChangeEvent&)> cb) {
    std::unique_lock lock(observers_mutex_);
    on_state_change_ = std::move(cb);
}

void CircuitBreakerRegistry::set_on_reject(std::function<void(const std::string&, CircuitState)> cb) {
    std::unique_lock lock(observers_mutex_);
    on_reject_ = std::move(cb);
}

void CircuitBreakerRegistry::attach_observers(CircuitBreaker& breaker) {
    breaker.set_on_state_change([this](const StateChangeEvent& e) {
        if (e.to == CircuitState::OPEN) {
            utils::log::warn(std::format(
                "[CircuitBreakerRegistry] Circuit '{}' OPENED - service degraded", e.breaker_name));
        } else if (e.to == CircuitState::CLOSED && e.from == CircuitState::HALF_OPEN) {
            utils::log::info(std::format(
                "[CircuitBreakerRegistry] Circuit '{}' recovered", e.breaker_name));
        }
        notify_state_change(e);
    });
    breaker.set_on_reject([this](const std::string& name, CircuitState state) {
        notify_reject(name, state);
    });
}

void CircuitBreakerRegistry::notify_state_change(const StateChangeEvent& event) const {
    std::function<void(const StateChangeEvent&)> cb;
    {
        std::shared_lock lock(observers_mutex_);
        cb = on_state_change_;
    }
    if (cb) cb(event);
}

void CircuitBreakerRegistry::notify_reject(const std::string& name, CircuitState state) const {
    std::function<void(const std::string&, CircuitState)> cb;
    {
        std::shared_lock lock(observers_mutex_);
        cb = on_reject_;
    }
    if (cb) cb(name, state);
}

} // namespace steadfast
