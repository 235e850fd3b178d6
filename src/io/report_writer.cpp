#include "expensescan/io/report_writer.hpp"
#include "expensescan/string_utils.hpp"
#include <iomanip>
#include <sstream>

namespace expensescan {

auto format_to_string(ReportFormat format) -> std::string {
    switch (format) {
    case ReportFormat::SUMMARY:
        return "summary";
    case ReportFormat::FIELDS:
        return "fields";
    }
    return "summary";
}

auto string_to_format(const std::string& str) -> std::optional<ReportFormat> {
    if (str == "summary") return ReportFormat::SUMMARY;
    if (str == "fields") return ReportFormat::FIELDS;
    return std::nullopt;
}

auto render_summary(const ExtractedRecord& record) -> std::string {
    std::ostringstream oss;

    if (record.total_amount) {
        oss << "Total: $" << StringUtils::format_amount(*record.total_amount) << "\n";
    }
    if (record.vendor_name) {
        oss << "Vendor: " << *record.vendor_name << "\n";
    }
    if (record.part_description) {
        oss << "Part: " << *record.part_description << "\n";
    }
    if (record.date) {
        oss << "Date: " << *record.date << "\n";
    }
    if (record.invoice_number) {
        oss << "Invoice #: " << *record.invoice_number << "\n";
    }
    if (auto description = compose_description(record)) {
        oss << "Description: " << *description << "\n";
    }

    oss << "Confidence: " << std::fixed << std::setprecision(1) << record.confidence_score * 100.0
        << "%\n";
    if (is_low_confidence(record.confidence_score)) {
        oss << "Warning: Low confidence - please verify data\n";
    }

    return oss.str();
}

auto render_fields(const ExtractedRecord& record) -> std::string {
    std::ostringstream oss;

    // Format: field|value, fixed field order, unset fields omitted
    if (record.vendor_name) {
        oss << "vendor_name|" << *record.vendor_name << "\n";
    }
    if (record.part_description) {
        oss << "part_description|" << *record.part_description << "\n";
    }
    if (record.total_amount) {
        oss << "total_amount|" << StringUtils::format_amount(*record.total_amount) << "\n";
    }
    if (record.date) {
        oss << "date|" << *record.date << "\n";
    }
    if (record.invoice_number) {
        oss << "invoice_number|" << *record.invoice_number << "\n";
    }
    if (auto description = compose_description(record)) {
        oss << "description|" << *description << "\n";
    }
    oss << "confidence_score|" << std::fixed << std::setprecision(3) << record.confidence_score
        << "\n";
    oss << "low_confidence|" << (is_low_confidence(record.confidence_score) ? "true" : "false")
        << "\n";

    return oss.str();
}

auto render_record(const ExtractedRecord& record, ReportFormat format) -> std::string {
    switch (format) {
    case ReportFormat::SUMMARY:
        return render_summary(record);
    case ReportFormat::FIELDS:
        return render_fields(record);
    }
    return render_summary(record);
}

} // namespace expensescan
