#include "expensescan/application/command_line.hpp"
#include <iostream>
#include <stdexcept>

namespace expensescan {

auto parse_confidence(const std::string& value) -> std::optional<double> {
    try {
        size_t consumed = 0;
        double percentage = std::stod(value, &consumed);
        // Written so NaN fails the range test
        if (consumed != value.size() || !(percentage >= 0.0 && percentage <= 100.0)) {
            return std::nullopt;
        }
        return percentage;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

auto parse_args(const std::vector<std::string>& args) -> std::optional<Config> {
    Config config;
    std::vector<std::string> inputs;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool takes_value = arg == "-c" || arg == "--confidence" || arg == "-f" || arg == "--format"
                           || arg == "-o" || arg == "--output";
        if (takes_value && i + 1 >= args.size()) {
            std::cerr << "Error: Missing value for " << arg << "\n";
            return std::nullopt;
        }

        if (arg == "-c" || arg == "--confidence") {
            auto percentage = parse_confidence(args[++i]);
            if (!percentage) {
                std::cerr << "Error: Confidence must be a number between 0 and 100\n";
                return std::nullopt;
            }
            config.confidence_percentage = *percentage;
        } else if (arg == "-f" || arg == "--format") {
            auto format = string_to_format(args[++i]);
            if (!format) {
                std::cerr << "Error: Unknown format '" << args[i] << "' (expected summary or fields)\n";
                return std::nullopt;
            }
            config.format = *format;
        } else if (arg == "-o" || arg == "--output") {
            config.output_file = args[++i];
        } else if (arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "-h" || arg == "--help") {
            config.show_help = true;
            return config;
        } else if (arg == "-" || arg.empty() || arg[0] != '-') {
            inputs.push_back(arg);
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return std::nullopt;
        }
    }

    if (!inputs.empty()) {
        config.input_files = std::move(inputs);
    }
    return config;
}

auto usage_text() -> std::string {
    return "Usage: expensescan [options] [file...]\n"
           "  -c, --confidence <pct>   OCR confidence percentage, 0-100 (default 100)\n"
           "  -f, --format <fmt>       Output format: summary or fields (default summary)\n"
           "  -o, --output <file>      Write the report to a file instead of stdout\n"
           "      --quiet              Suppress progress lines and warnings\n"
           "  -h, --help               Show this help\n"
           "\nReads recognized receipt text from each file, or stdin for '-' or no files.\n"
           "Progress lines go to stderr while the report is written to stdout.\n"
           "\nExamples:\n"
           "  tesseract receipt.png - | expensescan -c 91.2      # Piped OCR output\n"
           "  expensescan -f fields a.txt b.txt                 # Machine-readable fields\n";
}

} // namespace expensescan
