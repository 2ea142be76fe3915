#include "executor/replica_router.hpp"
#include "core/utils.hpp"

#include <mutex>

namespace steadfast {

bool is_read_only_query(std::string_view sql) {
    const auto text = utils::to_upper(utils::trim(sql));

    if (!text.starts_with("SELECT")) return false;

    if (text.find("FOR UPDATE") != std::string::npos ||
        text.find("FOR SHARE") != std::string::npos) {
        return false;
    }

    // Data-modifying CTE
    if (text.starts_with("WITH") && (text.find("INSERT") != std::string::npos ||
                                     text.find("UPDATE") != std::string::npos ||
                                     text.find("DELETE") != std::string::npos)) {
        return false;
    }

    return true;
}

ReplicaRouter::ReplicaRouter(std::shared_ptr<IConnectionPool> primary,
                             std::shared_ptr<IConnectionPool> replica)
    : primary_(std::move(primary)), replica_(std::move(replica)) {}

std::shared_ptr<IConnectionPool> ReplicaRouter::route(std::string_view sql, bool use_primary) {
    if (!use_primary && is_read_only_query(sql)) {
        if (auto r = replica()) {
            replica_queries_.fetch_add(1, std::memory_order_relaxed);
            return r;
        }
    }

    primary_queries_.fetch_add(1, std::memory_order_relaxed);
    return primary_;
}

std::shared_ptr<IConnectionPool> ReplicaRouter::replica() const {
    std::shared_lock lock(replica_mutex_);
    return replica_;
}

bool ReplicaRouter::has_replica() const {
    std::shared_lock lock(replica_mutex_);
    return replica_ != nullptr;
}

void ReplicaRouter::disable_replica() {
    std::shared_ptr<IConnectionPool> dropped;
    {
        std::unique_lock lock(replica_mutex_);
        dropped.swap(replica_);
    }
    if (dropped) {
        dropped->drain();
        utils::log::warn(std::format("[ReplicaRouter] Read replica '{}' disabled, using primary only",
            dropped->name()));
    }
}

ReplicaRouter::Stats ReplicaRouter::get_stats() const {
    return {
        .primary_queries = primary_queries_.load(std::memory_order_relaxed),
        .replica_queries = replica_queries_.load(std::memory_order_relaxed),
    };
}

} // namespace steadfast
