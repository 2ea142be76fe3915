#pragma once

#include "db/idb_connection.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace steadfast {

/**
 * @brief Conversions between PostgreSQL text-format values and JSON
 *
 * Rows come back from libpq as text; PgTypeMap turns them into JSON objects
 * keyed by column name, typed by the column's OID. Parameters go the other
 * way: JSON values become text parameters for PQexecParams.
 */
class PgTypeMap {
public:
    static constexpr uint32_t kBoolOid = 16;
    static constexpr uint32_t kInt8Oid = 20;
    static constexpr uint32_t kInt2Oid = 21;
    static constexpr uint32_t kInt4Oid = 23;
    static constexpr uint32_t kOidOid = 26;
    static constexpr uint32_t kJsonOid = 114;
    static constexpr uint32_t kFloat4Oid = 700;
    static constexpr uint32_t kFloat8Oid = 701;
    static constexpr uint32_t kJsonbOid = 3802;

    /**
     * @brief Decode one text value
     *
     * bool → boolean, int2/int4/int8/oid → integer, float4/float8 → number,
     * json/jsonb → parsed document. Everything else (numeric, timestamps,
     * text, unknown OIDs) stays a string so no precision is lost.
     */
    [[nodiscard]] static nlohmann::json decode_value(uint32_t oid, const std::string& text);

    /**
     * @brief Convert a result set to a vector of row objects
     */
    [[nodiscard]] static std::vector<nlohmann::json> to_rows(const DbResultSet& result);

    /**
     * @brief Encode a JSON value as a text parameter
     *
     * null → SQL NULL; strings bind verbatim; booleans as "true"/"false";
     * numbers via their JSON text; objects/arrays as JSON text (json/jsonb).
     */
    [[nodiscard]] static DbParam encode_param(const nlohmann::json& value);
};

} // namespace steadfast
