#include "expensescan/core/functional_core.hpp"
#include "expensescan/core/extraction_rules.hpp"
#include "expensescan/string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace expensescan::functional_core {

auto segment_lines(std::string_view raw_text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::istringstream iss{std::string(raw_text)};
    std::string line;

    while (std::getline(iss, line)) {
        auto trimmed = trim(line);
        if (!trimmed.empty()) {
            lines.push_back(std::move(trimmed));
        }
    }

    return lines;
}

auto extract_amount_candidates(const std::string& raw_text) -> std::vector<double> {
    std::vector<double> candidates;

    for (const auto& rule : amount_rules()) {
        for (const auto& match : find_matches(rule, raw_text)) {
            // Reduce "Total: $1,234.56" to "1,234.56" before parsing
            std::smatch number;
            if (!std::regex_search(match, number, amount_number_pattern())) {
                continue;
            }
            auto digits = StringUtils::strip_group_separators(number.str());
            if (auto amount = StringUtils::parse_decimal(digits)) {
                candidates.push_back(*amount);
            }
        }
    }

    return candidates;
}

auto is_valid_amount(double amount) -> bool {
    return amount > 0.0 && amount < MAX_VALID_AMOUNT;
}

auto choose_total_amount(std::span<const double> candidates) -> std::optional<double> {
    std::optional<double> best;
    for (double candidate : candidates) {
        if (!is_valid_amount(candidate)) {
            continue;
        }
        if (!best || candidate > *best) {
            best = candidate;
        }
    }
    return best;
}

auto extract_date(const std::string& raw_text) -> std::optional<std::string> {
    for (const auto& rule : date_rules()) {
        auto matches = find_matches(rule, raw_text);
        if (!matches.empty()) {
            return matches.front();
        }
    }
    return std::nullopt;
}

auto extract_invoice_number(const std::string& raw_text) -> std::optional<std::string> {
    for (const auto& rule : invoice_number_rules()) {
        for (const auto& token : find_matches(rule, raw_text, 1)) {
            // Skip label captures that are plain words ("Invoice from ...")
            if (StringUtils::contains_digit(token)) {
                return token;
            }
        }
    }
    return std::nullopt;
}

auto is_vendor_candidate(std::string_view line) -> bool {
    if (line.size() <= 2) {
        return false;
    }
    std::string text{line};
    return !starts_with_street_number(line) && !std::regex_search(text, phone_number_pattern());
}

auto starts_with_street_number(std::string_view line) -> bool {
    // "123 Main St": a digit run, then whitespace. Scanned by hand so a long
    // digit line costs no regex recursion.
    auto digits_end = line.find_first_not_of("0123456789");
    if (digits_end == 0 || digits_end == std::string_view::npos) {
        return false;
    }
    return std::isspace(static_cast<unsigned char>(line[digits_end])) != 0;
}

auto detect_vendor(std::span<const std::string> lines) -> std::optional<std::string> {
    std::optional<std::string> vendor;
    auto search_window = lines.first(std::min(lines.size(), VENDOR_SEARCH_LINES));

    for (const auto& line : search_window) {
        if (!is_vendor_candidate(line)) {
            continue;
        }
        // A later keyword line replaces an earlier default, even a better one
        if (!vendor || contains_any_keyword(line, vendor_keywords())) {
            vendor = line;
        }
    }

    return vendor;
}

auto detect_description(std::span<const std::string> lines) -> std::optional<std::string> {
    auto it = std::find_if(lines.begin(), lines.end(), [](const std::string& line) {
        return contains_any_keyword(line, description_keywords());
    });
    if (it == lines.end()) {
        return std::nullopt;
    }
    return *it;
}

auto to_lowercase(std::string_view text) -> std::string {
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto trim(std::string_view text) -> std::string {
    auto start = text.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n\f\v");
    return std::string(text.substr(start, end - start + 1));
}

auto contains_any_keyword(std::string_view line, std::span<const std::string_view> keywords) -> bool {
    auto lower = to_lowercase(line);
    return std::any_of(keywords.begin(), keywords.end(), [&lower](std::string_view keyword) {
        return lower.find(keyword) != std::string::npos;
    });
}

} // namespace expensescan::functional_core
