#pragma once

#include <optional>
#include <string>

namespace expensescan {

// Below this normalized score the UI should ask the user to verify the fields
inline constexpr double LOW_CONFIDENCE_THRESHOLD = 0.7;

// One recognition pass as delivered by the external OCR engine
struct OcrResult {
    std::string raw_text;
    double confidence_percentage{};  // 0-100
};

struct ExtractedRecord {
    std::optional<std::string> vendor_name;
    std::optional<std::string> part_description;
    std::optional<double> total_amount;
    std::optional<std::string> date;            // Verbatim matched text, never normalized
    std::optional<std::string> invoice_number;
    double confidence_score{};                  // 0-1

    auto operator==(const ExtractedRecord& other) const -> bool = default;
};

struct ConfidenceAssessment {
    double score{};
    bool low_confidence{};

    auto operator==(const ConfidenceAssessment& other) const -> bool = default;
};

// Advisory values for pre-filling the expense form
struct FormPrefill {
    std::optional<std::string> amount;       // Two decimals, no currency sign
    std::optional<std::string> description;
    bool low_confidence{};

    auto operator==(const FormPrefill& other) const -> bool = default;
};

auto normalize_confidence(double percentage) -> ConfidenceAssessment;
auto is_low_confidence(double score) -> bool;

// "Invoice from {vendor}[ - {description}]", or the description alone
auto compose_description(const ExtractedRecord& record) -> std::optional<std::string>;

auto build_form_prefill(const ExtractedRecord& record) -> FormPrefill;

} // namespace expensescan
