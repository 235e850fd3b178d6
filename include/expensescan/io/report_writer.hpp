#pragma once

#include "expensescan/core/extracted_record.hpp"
#include <optional>
#include <string>

namespace expensescan {

enum class ReportFormat {
    SUMMARY,   // Human-readable block
    FIELDS     // One field|value line per extracted field
};

auto format_to_string(ReportFormat format) -> std::string;
auto string_to_format(const std::string& str) -> std::optional<ReportFormat>;

auto render_summary(const ExtractedRecord& record) -> std::string;
auto render_fields(const ExtractedRecord& record) -> std::string;
auto render_record(const ExtractedRecord& record, ReportFormat format) -> std::string;

} // namespace expensescan
