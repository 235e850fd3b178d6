#include "expensescan/parsers/invoice_parser.hpp"
#include "expensescan/core/functional_core.hpp"

namespace expensescan {

auto InvoiceParser::parse(const OcrResult& ocr_result) -> ExtractedRecord {
    const auto& text = ocr_result.raw_text;
    auto lines = functional_core::segment_lines(text);
    auto candidates = functional_core::extract_amount_candidates(text);

    return ExtractedRecord{.vendor_name = functional_core::detect_vendor(lines),
                           .part_description = functional_core::detect_description(lines),
                           .total_amount = functional_core::choose_total_amount(candidates),
                           .date = functional_core::extract_date(text),
                           .invoice_number = functional_core::extract_invoice_number(text),
                           .confidence_score =
                               normalize_confidence(ocr_result.confidence_percentage).score};
}

} // namespace expensescan
