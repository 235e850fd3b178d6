#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace expensescan {

enum class MatchScope {
    FIRST_MATCH,   // Only the first occurrence in the text contributes
    ALL_MATCHES    // Every occurrence contributes, left to right
};

// A single searchable pattern for one field. Rule lists are ordered by priority.
// Repetitions in `pattern` are length-capped; a match touching one of the guard
// characters is the clipped piece of a longer run and is dropped.
struct ExtractionRule {
    std::string name;
    std::regex pattern;
    MatchScope scope = MatchScope::ALL_MATCHES;
    std::string_view before_guard;   // May not immediately precede a match
    std::string_view after_guard;    // May not immediately follow a match
};

using RuleList = std::vector<ExtractionRule>;

// Pooled: every rule is evaluated and all candidates compete
auto amount_rules() -> const RuleList&;

// First rule producing any match wins
auto date_rules() -> const RuleList&;

// First rule producing a usable token wins; capture group 1 is the token
auto invoice_number_rules() -> const RuleList&;

// Substring that every amount match is reduced to before parsing
auto amount_number_pattern() -> const std::regex&;

// Vendor line filters and keyword sets
auto phone_number_pattern() -> const std::regex&;
auto vendor_keywords() -> const std::vector<std::string_view>&;
auto description_keywords() -> const std::vector<std::string_view>&;

// Every matched substring of `rule` in `text`, honoring its scope and guards.
// `group` selects a capture group instead of the whole match. For FIRST_MATCH
// rules only the first raw match is considered, even when a guard drops it.
auto find_matches(const ExtractionRule& rule, const std::string& text, size_t group = 0)
    -> std::vector<std::string>;

} // namespace expensescan
