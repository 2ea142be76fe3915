#include "db/postgresql/pg_type_map.hpp"

#include <charconv>

namespace steadfast {

nlohmann::json PgTypeMap::decode_value(uint32_t oid, const std::string& text) {
    switch (oid) {
        case kBoolOid:
            return text == "t" || text == "true";

        case kInt2Oid:
        case kInt4Oid:
        case kInt8Oid:
        case kOidOid: {
            int64_t n = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
            if (ec == std::errc() && ptr == text.data() + text.size()) return n;
            return text;
        }

        case kFloat4Oid:
        case kFloat8Oid: {
            // NaN / Infinity have no JSON representation
            auto parsed = nlohmann::json::parse(text, nullptr, false);
            return parsed.is_number() ? parsed : nlohmann::json(text);
        }

        case kJsonOid:
        case kJsonbOid: {
            auto parsed = nlohmann::json::parse(text, nullptr, false);
            return parsed.is_discarded() ? nlohmann::json(text) : parsed;
        }

        default:
            return text;
    }
}

std::vector<nlohmann::json> PgTypeMap::to_rows(const DbResultSet& result) {
    std::vector<nlohmann::json> rows;
    rows.reserve(result.rows.size());

    for (const auto& raw : result.rows) {
        nlohmann::json row = nlohmann::json::object();
        for (size_t i = 0; i < result.column_names.size() && i < raw.size(); ++i) {
            const auto& name = result.column_names[i];
            if (!raw[i]) {
                row[name] = nullptr;
                continue;
            }
            const uint32_t oid = i < result.column_type_oids.size() ? result.column_type_oids[i] : 0;
            row[name] = decode_value(oid, *raw[i]);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

DbParam PgTypeMap::encode_param(const nlohmann::json& value) {
    if (value.is_null()) return std::nullopt;
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
    return value.dump();
}

} // namespace steadfast
