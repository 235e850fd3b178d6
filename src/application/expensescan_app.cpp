#include "expensescan/application/expensescan_app.hpp"
#include <iostream>

namespace expensescan {

namespace {

// Keeps stdout clean for the report when no output file is given
auto status_stream(const Config& config) -> std::ostream& {
    return config.output_file.empty() ? std::cerr : std::cout;
}

} // namespace

ExpenseScanApp::ExpenseScanApp(std::unique_ptr<IFileSystem> filesystem,
                               std::unique_ptr<IInvoiceParser> parser)
    : filesystem_(std::move(filesystem)), parser_(std::move(parser)) {}

auto ExpenseScanApp::run(const Config& config) -> int {
    std::string report;
    size_t extracted = 0;
    bool any_failed = false;

    for (const auto& input : config.input_files) {
        auto record = process_input(input, config);
        if (!record) {
            any_failed = true;
            continue;
        }

        if (config.input_files.size() > 1) {
            report += "== " + input + "\n";
        }
        report += render_record(*record, config.format);
        ++extracted;
    }

    if (!config.quiet) {
        status_stream(config) << "Extracted " << extracted << (extracted == 1 ? " record" : " records")
                  << ".\n";
    }

    if (extracted > 0 && !emit_report(report, config)) {
        std::cerr << "Error: Could not write report to " << config.output_file << "\n";
        return 1;
    }

    return any_failed ? 1 : 0;
}

auto ExpenseScanApp::load_text(const std::string& input) -> std::optional<std::string> {
    if (input == "-") {
        return filesystem_->read_stdin();
    }
    if (!filesystem_->file_exists(input)) {
        return std::nullopt;
    }
    return filesystem_->read_text(input);
}

auto ExpenseScanApp::process_input(const std::string& input, const Config& config)
    -> std::optional<ExtractedRecord> {
    if (!config.quiet) {
        status_stream(config) << "Processing " << (input == "-" ? "stdin" : input) << "...\n";
    }

    auto text = load_text(input);
    if (!text) {
        std::cerr << "Error: Could not read " << input << "\n";
        return std::nullopt;
    }

    auto record = parser_->parse(OcrResult{.raw_text = *text,
                                           .confidence_percentage = config.confidence_percentage});

    if (!config.quiet && is_low_confidence(record.confidence_score)) {
        std::cerr << "Warning: Low OCR confidence for " << input << ", please verify the data\n";
    }

    return record;
}

auto ExpenseScanApp::emit_report(const std::string& report, const Config& config) -> bool {
    if (config.output_file.empty()) {
        std::cout << report;
        return static_cast<bool>(std::cout);
    }

    if (!filesystem_->write_text(report, config.output_file)) {
        return false;
    }
    if (!config.quiet) {
        std::cout << "Saved report to " << config.output_file << "\n";
    }
    return true;
}

} // namespace expensescan
