#pragma once

#include <optional>
#include <string>

namespace expensescan {

// Forward declarations
struct ExtractedRecord;
struct OcrResult;

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_text(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto read_stdin() -> std::string = 0;
    virtual auto write_text(const std::string& text, const std::string& path) -> bool = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
};

class IInvoiceParser {
public:
    virtual ~IInvoiceParser() = default;
    virtual auto parse(const OcrResult& ocr_result) -> ExtractedRecord = 0;
};

} // namespace expensescan
