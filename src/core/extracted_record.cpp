#include "expensescan/core/extracted_record.hpp"
#include "expensescan/string_utils.hpp"

namespace expensescan {

auto normalize_confidence(double percentage) -> ConfidenceAssessment {
    double score = percentage / 100.0;
    return ConfidenceAssessment{.score = score, .low_confidence = is_low_confidence(score)};
}

auto is_low_confidence(double score) -> bool {
    return score < LOW_CONFIDENCE_THRESHOLD;
}

auto compose_description(const ExtractedRecord& record) -> std::optional<std::string> {
    if (record.vendor_name) {
        std::string line = "Invoice from " + *record.vendor_name;
        if (record.part_description) {
            line += " - " + *record.part_description;
        }
        return line;
    }
    if (record.part_description) {
        return *record.part_description;
    }
    return std::nullopt;
}

auto build_form_prefill(const ExtractedRecord& record) -> FormPrefill {
    FormPrefill prefill;
    if (record.total_amount) {
        prefill.amount = StringUtils::format_amount(*record.total_amount);
    }
    prefill.description = compose_description(record);
    prefill.low_confidence = is_low_confidence(record.confidence_score);
    return prefill;
}

} // namespace expensescan
