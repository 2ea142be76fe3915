#pragma once

#include <string>
#include <string_view>

namespace steadfast {

/**
 * @brief Allow-list and syntax checks for identifiers spliced into SQL
 *
 * Values always travel as bound parameters; table and column names cannot,
 * so every one of them passes through here first.
 */
class IdentifierGuard {
public:
    /**
     * @brief True for tables the bot is allowed to touch
     */
    [[nodiscard]] static bool is_allowed_table(std::string_view table);

    /**
     * @brief True for ^[A-Za-z_][A-Za-z0-9_]*$
     */
    [[nodiscard]] static bool is_valid_identifier(std::string_view name);

    /**
     * @throws InvalidIdentifierError when the table is not allow-listed
     */
    static void validate_table(std::string_view table);

    /**
     * @throws InvalidIdentifierError when the name is not a plain identifier
     */
    static void validate_identifier(std::string_view name);
};

} // namespace steadfast
