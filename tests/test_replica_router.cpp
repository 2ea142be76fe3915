#include <catch2/catch_test_macros.hpp>
#include "executor/replica_router.hpp"
#include "db/pooled_connection.hpp"

using namespace steadfast;

namespace {

class StubPool : public IConnectionPool {
public:
    explicit StubPool(std::string name) : name_(std::move(name)) {}

    std::unique_ptr<PooledConnection> acquire(std::chrono::milliseconds) override { return nullptr; }
    PoolStats get_stats() const override { return {}; }
    void drain() override { drained = true; }
    const std::string& name() const override { return name_; }

    bool drained = false;

private:
    std::string name_;
};

} // namespace

TEST_CASE("is_read_only_query: plain SELECT is a read", "[router]") {
    CHECK(is_read_only_query("SELECT * FROM user_data WHERE user_id = $1"));
    CHECK(is_read_only_query("  \n\tselect count(*) from snipes"));
    CHECK(is_read_only_query("Select 1"));
}

TEST_CASE("is_read_only_query: locking reads and writes go to the primary", "[router]") {
    CHECK_FALSE(is_read_only_query("SELECT * FROM raid_mode WHERE guild_id = $1 FOR UPDATE"));
    CHECK_FALSE(is_read_only_query("select * from playlists for share"));
    CHECK_FALSE(is_read_only_query("INSERT INTO snipes (channel_id) VALUES ($1)"));
    CHECK_FALSE(is_read_only_query("UPDATE user_data SET xp = xp + 1"));
    CHECK_FALSE(is_read_only_query("DELETE FROM user_afk WHERE user_id = $1"));
    CHECK_FALSE(is_read_only_query("BEGIN"));
    CHECK_FALSE(is_read_only_query(""));
}

TEST_CASE("is_read_only_query: CTEs always run on the primary", "[router]") {
    CHECK_FALSE(is_read_only_query("WITH x AS (SELECT 1) SELECT * FROM x"));
    CHECK_FALSE(is_read_only_query(
        "WITH moved AS (DELETE FROM snipes RETURNING *) SELECT count(*) FROM moved"));
}

TEST_CASE("ReplicaRouter: without a replica everything goes to the primary", "[router]") {
    auto primary = std::make_shared<StubPool>("primary");
    ReplicaRouter router(primary);

    CHECK_FALSE(router.has_replica());
    CHECK(router.route("SELECT 1") == primary);
    CHECK(router.route("UPDATE guild_settings SET prefix = $1") == primary);

    const auto stats = router.get_stats();
    CHECK(stats.primary_queries == 2);
    CHECK(stats.replica_queries == 0);
}

TEST_CASE("ReplicaRouter: reads go to the replica unless forced", "[router]") {
    auto primary = std::make_shared<StubPool>("primary");
    auto replica = std::make_shared<StubPool>("replica");
    ReplicaRouter router(primary, replica);

    CHECK(router.has_replica());
    CHECK(router.route("SELECT * FROM bot_stats") == replica);
    CHECK(router.route("SELECT * FROM bot_stats", true) == primary);
    CHECK(router.route("INSERT INTO bot_stats (key) VALUES ($1)") == primary);
    CHECK(router.route("SELECT * FROM mod_infractions FOR UPDATE") == primary);

    const auto stats = router.get_stats();
    CHECK(stats.primary_queries == 3);
    CHECK(stats.replica_queries == 1);
}

TEST_CASE("ReplicaRouter: disable_replica drains and falls back", "[router]") {
    auto primary = std::make_shared<StubPool>("primary");
    auto replica = std::make_shared<StubPool>("replica");
    ReplicaRouter router(primary, replica);

    router.disable_replica();

    CHECK(replica->drained);
    CHECK_FALSE(primary->drained);
    CHECK_FALSE(router.has_replica());
    CHECK(router.replica() == nullptr);
    CHECK(router.route("SELECT 1") == primary);

    // Second call is a no-op
    router.disable_replica();
    CHECK(router.route("SELECT 1") == primary);
}
