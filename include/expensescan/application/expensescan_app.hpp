#pragma once

#include "expensescan/core/extracted_record.hpp"
#include "expensescan/interfaces.hpp"
#include "expensescan/io/report_writer.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace expensescan {

struct Config {
    std::vector<std::string> input_files = {"-"};   // stdin by default
    double confidence_percentage = 100.0;
    ReportFormat format = ReportFormat::SUMMARY;
    std::string output_file;                        // stdout when empty
    bool quiet = false;
    bool show_help = false;
};

class ExpenseScanApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<IInvoiceParser> parser_;

public:
    ExpenseScanApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<IInvoiceParser> parser);

    auto run(const Config& config) -> int;

private:
    auto load_text(const std::string& input) -> std::optional<std::string>;
    auto process_input(const std::string& input, const Config& config) -> std::optional<ExtractedRecord>;
    auto emit_report(const std::string& report, const Config& config) -> bool;
};

} // namespace expensescan
