#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace expensescan {

class StringUtils {
public:
    // Remove thousands separators ("1,234.56" -> "1234.56")
    static auto strip_group_separators(std::string_view text) -> std::string;

    // Parse a plain decimal such as "245.50" or "12."; nullopt when nothing parses
    static auto parse_decimal(const std::string& text) -> std::optional<double>;

    // Fixed two-decimal rendering used for money fields
    static auto format_amount(double amount) -> std::string;

    static auto contains_digit(std::string_view text) -> bool;
};

} // namespace expensescan
