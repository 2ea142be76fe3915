#include "db/identifier_guard.hpp"
#include "core/error.hpp"

#include <format>
#include <string>
#include <unordered_set>

namespace steadfast {

namespace {

const std::unordered_set<std::string_view>& allowed_tables() {
    static const std::unordered_set<std::string_view> tables = {
        "guild_settings",
        "moderation_logs",
        "user_data",
        "guild_user_data",
        "user_afk",
        "snipes",
        "playlists",
        "bot_stats",
        "command_analytics",
        "nhentai_favourites",
        "anime_favourites",
        "anime_notifications",
        "automod_settings",
        "mod_log_settings",
        "mod_infractions",
        "word_filters",
        "warn_thresholds",
        "raid_mode",
        "user_music_preferences",
        "user_music_favorites",
        "user_music_history",
    };
    return tables;
}

bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_ident_char(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

} // anonymous namespace

bool IdentifierGuard::is_allowed_table(std::string_view table) {
    return allowed_tables().contains(table);
}

bool IdentifierGuard::is_valid_identifier(std::string_view name) {
    if (name.empty() || !is_ident_start(name.front())) return false;
    for (const char c : name.substr(1)) {
        if (!is_ident_char(c)) return false;
    }
    return true;
}

void IdentifierGuard::validate_table(std::string_view table) {
    if (!is_allowed_table(table)) {
        throw InvalidIdentifierError(std::format("Invalid table name: {}", table));
    }
}

void IdentifierGuard::validate_identifier(std::string_view name) {
    if (!is_valid_identifier(name)) {
        throw InvalidIdentifierError(std::format("Invalid identifier: {}", name));
    }
}

} // namespace steadfast
