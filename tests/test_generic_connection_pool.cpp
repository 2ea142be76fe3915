#include <catch2/catch_test_macros.hpp>
#include "db/generic_connection_pool.hpp"
#include "mocks/mock_connection.hpp"

#include <thread>

using namespace steadfast;
using namespace steadfast::testing;
using namespace std::chrono_literals;

namespace {

PoolConfig pool_config(size_t min, size_t max) {
    PoolConfig cfg;
    cfg.connection_string = "host='db' port=5432";
    cfg.min_connections = min;
    cfg.max_connections = max;
    return cfg;
}

} // namespace

TEST_CASE("ConnectionPool: warm-up opens min_connections", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    GenericConnectionPool pool("primary", pool_config(2, 4), std::make_shared<MockConnectionFactory>(db));

    const auto stats = pool.get_stats();
    CHECK(stats.total_connections == 2);
    CHECK(stats.idle_connections == 2);
    CHECK(stats.active_connections == 0);
    CHECK(stats.max_connections == 4);
    CHECK(db->connections_opened.load() == 2);
    CHECK(pool.name() == "primary");
}

TEST_CASE("ConnectionPool: acquire and release update stats", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    GenericConnectionPool pool("primary", pool_config(1, 4), std::make_shared<MockConnectionFactory>(db));

    {
        auto a = pool.acquire(100ms);
        auto b = pool.acquire(100ms);
        REQUIRE(a != nullptr);
        REQUIRE(b != nullptr);
        CHECK(a->is_valid());

        const auto busy = pool.get_stats();
        CHECK(busy.total_connections == 2);
        CHECK(busy.active_connections == 2);
        CHECK(busy.idle_connections == 0);
    }

    const auto stats = pool.get_stats();
    CHECK(stats.total_acquires == 2);
    CHECK(stats.total_releases == 2);
    CHECK(stats.idle_connections == 2);
    CHECK(stats.active_connections == 0);
}

TEST_CASE("ConnectionPool: release is idempotent", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    GenericConnectionPool pool("primary", pool_config(1, 1), std::make_shared<MockConnectionFactory>(db));

    auto conn = pool.acquire(100ms);
    REQUIRE(conn != nullptr);
    conn->release();
    conn->release();
    conn.reset();

    CHECK(pool.get_stats().total_releases == 1);
    CHECK(pool.acquire(100ms) != nullptr);
}

TEST_CASE("ConnectionPool: acquire times out at max_connections", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    GenericConnectionPool pool("primary", pool_config(0, 1), std::make_shared<MockConnectionFactory>(db));

    auto held = pool.acquire(100ms);
    REQUIRE(held != nullptr);

    const auto start = std::chrono::steady_clock::now();
    auto second = pool.acquire(30ms);
    const auto waited = std::chrono::steady_clock::now() - start;

    CHECK(second == nullptr);
    CHECK(waited >= 25ms);
    CHECK(pool.get_stats().failed_acquires == 1);
}

TEST_CASE("ConnectionPool: waiting callers are counted and served on release", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    GenericConnectionPool pool("primary", pool_config(0, 1), std::make_shared<MockConnectionFactory>(db));

    auto held = pool.acquire(100ms);
    REQUIRE(held != nullptr);

    std::unique_ptr<PooledConnection> served;
    std::thread waiter([&] { served = pool.acquire(2000ms); });

    for (int i = 0; i < 100 && pool.get_stats().waiting_requests == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    CHECK(pool.get_stats().waiting_requests == 1);

    held.reset();
    waiter.join();

    CHECK(served != nullptr);
    CHECK(pool.get_stats().waiting_requests == 0);
}

TEST_CASE("ConnectionPool: discarded connections are closed, not recycled", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    GenericConnectionPool pool("primary", pool_config(1, 2), std::make_shared<MockConnectionFactory>(db));

    {
        auto conn = pool.acquire(100ms);
        REQUIRE(conn != nullptr);
        conn->discard();
    }

    const auto stats = pool.get_stats();
    CHECK(stats.total_connections == 0);
    CHECK(stats.idle_connections == 0);
    CHECK(db->connections_closed.load() == 1);

    // Slot was returned; a fresh connection is opened on demand
    CHECK(pool.acquire(100ms) != nullptr);
    CHECK(db->connections_opened.load() == 2);
}

TEST_CASE("ConnectionPool: stale idle connection is health checked", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    auto cfg = pool_config(1, 2);
    cfg.idle_timeout = 1ms;
    GenericConnectionPool pool("primary", cfg, std::make_shared<MockConnectionFactory>(db));

    db->set_responder([](const std::string&, const std::string& sql, const DbParams&) {
        return sql == "SELECT 1" ? MockDatabase::error("terminating connection", "57P01")
                                 : MockDatabase::ok();
    });
    std::this_thread::sleep_for(10ms);

    auto conn = pool.acquire(100ms);
    REQUIRE(conn != nullptr);

    const auto stats = pool.get_stats();
    CHECK(stats.health_check_failures == 1);
    CHECK(db->connections_closed.load() == 1);
    CHECK(db->connections_opened.load() == 2);
    CHECK(db->count("SELECT 1") == 1);
}

TEST_CASE("ConnectionPool: factory failure fails the acquire", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    db->refuse_host("db");
    GenericConnectionPool pool("primary", pool_config(2, 2), std::make_shared<MockConnectionFactory>(db));

    CHECK(pool.get_stats().total_connections == 0);
    CHECK(pool.acquire(50ms) == nullptr);
    CHECK(pool.get_stats().failed_acquires == 1);

    // The slot is not leaked
    db->accept_all();
    auto a = pool.acquire(50ms);
    auto b = pool.acquire(50ms);
    CHECK(a != nullptr);
    CHECK(b != nullptr);
}

TEST_CASE("ConnectionPool: drain closes idle connections and refuses acquires", "[pool]") {
    auto db = std::make_shared<MockDatabase>();
    GenericConnectionPool pool("replica", pool_config(2, 3), std::make_shared<MockConnectionFactory>(db));

    auto leased = pool.acquire(100ms);
    REQUIRE(leased != nullptr);

    pool.drain();
    CHECK(db->connections_closed.load() == 1);
    CHECK(pool.acquire(10ms) == nullptr);

    // Leased connection is closed when it comes back
    leased.reset();
    CHECK(db->connections_closed.load() == 2);
    CHECK(pool.get_stats().total_connections == 0);
}
