#include "expensescan/core/extraction_rules.hpp"

namespace expensescan {

namespace {

constexpr auto ECMA = std::regex::ECMAScript;
constexpr auto ECMA_ICASE = std::regex::ECMAScript | std::regex::icase;

// Guard sets for the capped repetitions below
constexpr std::string_view DIGITS = "0123456789";
constexpr std::string_view NUMBER_CHARS = "0123456789,";
constexpr std::string_view TOKEN_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-";

auto touches(std::string_view guard, const std::string& text, size_t index) -> bool {
    return index < text.size() && guard.find(text[index]) != std::string_view::npos;
}

} // namespace

// std::regex matches recursively, one frame per repeated character, so every
// repetition is bounded to keep long noise runs off the stack.

auto amount_rules() -> const RuleList& {
    static const RuleList rules{
        ExtractionRule{
            .name = "labeled-total",
            .pattern = std::regex(
                R"((?:total|amount|sum|price|cost)[\s:]{0,64}\$?([0-9,]{1,32}\.?[0-9]{0,32}))",
                ECMA_ICASE),
            .scope = MatchScope::FIRST_MATCH,
            .before_guard = {},
            .after_guard = DIGITS},
        ExtractionRule{.name = "dollar-prefixed",
                       .pattern = std::regex(R"(\$([0-9,]{1,32}\.?[0-9]{0,32}))", ECMA),
                       .scope = MatchScope::ALL_MATCHES,
                       .before_guard = {},
                       .after_guard = DIGITS},
        ExtractionRule{.name = "two-decimal",
                       .pattern = std::regex(R"(([0-9,]{1,32}\.[0-9]{2}))", ECMA),
                       .scope = MatchScope::ALL_MATCHES,
                       .before_guard = NUMBER_CHARS,
                       .after_guard = {}}};
    return rules;
}

auto date_rules() -> const RuleList& {
    static const RuleList rules{
        ExtractionRule{.name = "day-first",
                       .pattern = std::regex(R"(\d{1,2}[/\-]\d{1,2}[/\-]\d{2,4})", ECMA),
                       .scope = MatchScope::FIRST_MATCH},
        ExtractionRule{.name = "year-first",
                       .pattern = std::regex(R"(\d{2,4}[/\-]\d{1,2}[/\-]\d{1,2})", ECMA),
                       .scope = MatchScope::FIRST_MATCH},
        ExtractionRule{
            .name = "month-name",
            .pattern = std::regex(
                R"((jan|feb|mar|apr|may|jun|jul|aug|sep|oct|nov|dec)\w{0,16}\s{1,32}\d{1,2},?\s{1,32}\d{2,4})",
                ECMA_ICASE),
            .scope = MatchScope::FIRST_MATCH}};
    return rules;
}

auto invoice_number_rules() -> const RuleList& {
    static const RuleList rules{
        ExtractionRule{
            .name = "invoice-label",
            .pattern = std::regex(
                R"(invoice[ \t]{0,16}(?:no\.?|number|#)?[: \t#]{0,16}([A-Z0-9][A-Z0-9\-]{0,63}))",
                ECMA_ICASE),
            .scope = MatchScope::ALL_MATCHES,
            .before_guard = {},
            .after_guard = TOKEN_CHARS},
        ExtractionRule{
            .name = "inv-label",
            .pattern = std::regex(R"(\binv[ \t]{0,16}#?[: \t]{0,16}([A-Z0-9][A-Z0-9\-]{0,63}))",
                                  ECMA_ICASE),
            .scope = MatchScope::ALL_MATCHES,
            .before_guard = {},
            .after_guard = TOKEN_CHARS},
        ExtractionRule{.name = "hash-token",
                       .pattern = std::regex(R"(#([A-Z0-9\-]{4,64}))", ECMA_ICASE),
                       .scope = MatchScope::ALL_MATCHES,
                       .before_guard = {},
                       .after_guard = TOKEN_CHARS}};
    return rules;
}

auto amount_number_pattern() -> const std::regex& {
    // Only ever applied to a single capped match
    static const std::regex pattern{R"([0-9,]+\.?[0-9]*)"};
    return pattern;
}

auto phone_number_pattern() -> const std::regex& {
    static const std::regex pattern{R"(\d{3}-\d{3}-\d{4})"};
    return pattern;
}

auto vendor_keywords() -> const std::vector<std::string_view>& {
    static const std::vector<std::string_view> keywords{"vendor", "company", "business", "corp",
                                                        "inc",    "llc",     "ltd"};
    return keywords;
}

auto description_keywords() -> const std::vector<std::string_view>& {
    static const std::vector<std::string_view> keywords{
        "part", "product", "item", "service", "repair", "maintenance", "component"};
    return keywords;
}

auto find_matches(const ExtractionRule& rule, const std::string& text, size_t group)
    -> std::vector<std::string> {
    std::vector<std::string> matches;
    auto begin = std::sregex_iterator(text.begin(), text.end(), rule.pattern);
    auto end = std::sregex_iterator();

    for (auto it = begin; it != end; ++it) {
        auto start = static_cast<size_t>(it->position(0));
        auto stop = start + static_cast<size_t>(it->length(0));

        bool clipped = (start > 0 && touches(rule.before_guard, text, start - 1))
                       || touches(rule.after_guard, text, stop);
        if (!clipped) {
            matches.push_back(it->str(group));
        }
        if (rule.scope == MatchScope::FIRST_MATCH) {
            break;
        }
    }

    return matches;
}

} // namespace expensescan
