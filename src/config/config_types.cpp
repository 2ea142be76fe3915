#include "config/config_types.hpp"

#include <algorithm>
#include <format>

namespace steadfast {

namespace {

// libpq keyword/value quoting: single quotes, backslash-escape ' and backslash
std::string quote_conninfo_value(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

} // anonymous namespace

std::string EndpointConfig::to_connection_string(std::chrono::milliseconds connect_timeout) const {
    const auto seconds = std::max<int64_t>(
        1, std::chrono::duration_cast<std::chrono::seconds>(connect_timeout).count());

    std::string conninfo = std::format("host={} port={}", quote_conninfo_value(host), port);
    if (!user.empty()) {
        conninfo += " user=" + quote_conninfo_value(user);
    }
    if (!password.empty()) {
        conninfo += " password=" + quote_conninfo_value(password);
    }
    if (!database.empty()) {
        conninfo += " dbname=" + quote_conninfo_value(database);
    }
    conninfo += std::format(" connect_timeout={}", seconds);
    return conninfo;
}

} // namespace steadfast
