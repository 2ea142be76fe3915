#include <catch2/catch_test_macros.hpp>
#include "db/postgresql/pg_type_map.hpp"

using namespace steadfast;
using json = nlohmann::json;

TEST_CASE("PgTypeMap: booleans", "[pg_type_map]") {
    CHECK(PgTypeMap::decode_value(PgTypeMap::kBoolOid, "t") == json(true));
    CHECK(PgTypeMap::decode_value(PgTypeMap::kBoolOid, "f") == json(false));
}

TEST_CASE("PgTypeMap: integers", "[pg_type_map]") {
    CHECK(PgTypeMap::decode_value(PgTypeMap::kInt4Oid, "42") == json(42));
    CHECK(PgTypeMap::decode_value(PgTypeMap::kInt2Oid, "-7") == json(-7));
    CHECK(PgTypeMap::decode_value(PgTypeMap::kInt8Oid, "9007199254740993")
          == json(int64_t{9007199254740993}));

    // Garbage stays text rather than becoming zero
    CHECK(PgTypeMap::decode_value(PgTypeMap::kInt4Oid, "12abc") == json("12abc"));
}

TEST_CASE("PgTypeMap: floats", "[pg_type_map]") {
    CHECK(PgTypeMap::decode_value(PgTypeMap::kFloat8Oid, "1.5") == json(1.5));
    CHECK(PgTypeMap::decode_value(PgTypeMap::kFloat4Oid, "NaN") == json("NaN"));
    CHECK(PgTypeMap::decode_value(PgTypeMap::kFloat8Oid, "Infinity") == json("Infinity"));
}

TEST_CASE("PgTypeMap: json and jsonb are parsed", "[pg_type_map]") {
    const auto doc = PgTypeMap::decode_value(PgTypeMap::kJsonbOid, R"({"volume":80,"loop":true})");
    REQUIRE(doc.is_object());
    CHECK(doc["volume"] == 80);
    CHECK(doc["loop"] == true);

    CHECK(PgTypeMap::decode_value(PgTypeMap::kJsonOid, "[1,2]") == json::array({1, 2}));
    CHECK(PgTypeMap::decode_value(PgTypeMap::kJsonOid, "{broken") == json("{broken"));
}

TEST_CASE("PgTypeMap: other types stay strings", "[pg_type_map]") {
    // numeric (1700) keeps its exact text
    CHECK(PgTypeMap::decode_value(1700, "12345678901234567890.01") == json("12345678901234567890.01"));
    CHECK(PgTypeMap::decode_value(1184, "2024-01-01 00:00:00+00") == json("2024-01-01 00:00:00+00"));
    CHECK(PgTypeMap::decode_value(0, "hello") == json("hello"));
}

TEST_CASE("PgTypeMap: to_rows builds objects keyed by column", "[pg_type_map]") {
    DbResultSet rs;
    rs.success = true;
    rs.has_rows = true;
    rs.column_names = {"user_id", "xp", "afk_reason"};
    rs.column_type_oids = {PgTypeMap::kInt8Oid, PgTypeMap::kInt4Oid, 25};
    rs.rows = {
        {std::string("100"), std::string("250"), std::nullopt},
        {std::string("101"), std::string("0"), std::string("lunch")},
    };

    const auto rows = PgTypeMap::to_rows(rs);
    REQUIRE(rows.size() == 2);
    CHECK(rows[0]["user_id"] == 100);
    CHECK(rows[0]["xp"] == 250);
    CHECK(rows[0]["afk_reason"].is_null());
    CHECK(rows[1]["afk_reason"] == "lunch");
}

TEST_CASE("PgTypeMap: to_rows without type information yields strings", "[pg_type_map]") {
    DbResultSet rs;
    rs.column_names = {"n"};
    rs.rows = {{std::string("5")}};

    const auto rows = PgTypeMap::to_rows(rs);
    REQUIRE(rows.size() == 1);
    CHECK(rows[0]["n"] == "5");
}

TEST_CASE("PgTypeMap: encode_param", "[pg_type_map]") {
    CHECK_FALSE(PgTypeMap::encode_param(nullptr).has_value());
    CHECK(PgTypeMap::encode_param("plain 'text'") == DbParam("plain 'text'"));
    CHECK(PgTypeMap::encode_param(true) == DbParam("true"));
    CHECK(PgTypeMap::encode_param(false) == DbParam("false"));
    CHECK(PgTypeMap::encode_param(42) == DbParam("42"));
    CHECK(PgTypeMap::encode_param(json{{"a", 1}}) == DbParam(R"({"a":1})"));
    CHECK(PgTypeMap::encode_param(json::array({"x", "y"})) == DbParam(R"(["x","y"])"));
}
