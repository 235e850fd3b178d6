#include "expensescan/string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace expensescan {

auto StringUtils::strip_group_separators(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c != ',') {
            result.push_back(c);
        }
    }
    return result;
}

auto StringUtils::parse_decimal(const std::string& text) -> std::optional<double> {
    try {
        return std::stod(text);
    } catch (const std::exception&) {
        // Empty or separator-only text
        return std::nullopt;
    }
}

auto StringUtils::format_amount(double amount) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << amount;
    return oss.str();
}

auto StringUtils::contains_digit(std::string_view text) -> bool {
    return std::any_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace expensescan
