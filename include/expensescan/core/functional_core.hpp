#pragma once

#include "expensescan/core/extracted_record.hpp"
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace expensescan::functional_core {

// Vendor names are only looked for near the top of the document
inline constexpr size_t VENDOR_SEARCH_LINES = 5;

inline constexpr double MAX_VALID_AMOUNT = 100000.0;

// Line segmentation (pure)
auto segment_lines(std::string_view raw_text) -> std::vector<std::string>;

// Amount extraction (pure)
auto extract_amount_candidates(const std::string& raw_text) -> std::vector<double>;
auto is_valid_amount(double amount) -> bool;
auto choose_total_amount(std::span<const double> candidates) -> std::optional<double>;

// Date extraction (pure)
auto extract_date(const std::string& raw_text) -> std::optional<std::string>;

// Invoice number extraction (pure)
auto extract_invoice_number(const std::string& raw_text) -> std::optional<std::string>;

// Vendor detection (pure)
auto is_vendor_candidate(std::string_view line) -> bool;
auto starts_with_street_number(std::string_view line) -> bool;
auto detect_vendor(std::span<const std::string> lines) -> std::optional<std::string>;

// Description detection (pure)
auto detect_description(std::span<const std::string> lines) -> std::optional<std::string>;

// Text helpers
auto to_lowercase(std::string_view text) -> std::string;
auto trim(std::string_view text) -> std::string;
auto contains_any_keyword(std::string_view line, std::span<const std::string_view> keywords) -> bool;

} // namespace expensescan::functional_core
