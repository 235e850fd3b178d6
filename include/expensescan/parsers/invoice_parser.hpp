#pragma once

#include "expensescan/core/extracted_record.hpp"
#include "expensescan/interfaces.hpp"

namespace expensescan {

// Turns recognized receipt/invoice text into an ExtractedRecord.
// Stateless: every call depends only on its argument.
class InvoiceParser : public IInvoiceParser {
public:
    auto parse(const OcrResult& ocr_result) -> ExtractedRecord override;
};

} // namespace expensescan
