#include "expensescan/application/command_line.hpp"
#include "expensescan/application/expensescan_app.hpp"
#include "expensescan/io/file_system.hpp"
#include "expensescan/parsers/invoice_parser.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto config = expensescan::parse_args(args);
    if (!config) {
        std::cerr << expensescan::usage_text();
        return 2;
    }
    if (config->show_help) {
        std::cout << expensescan::usage_text();
        return 0;
    }

    expensescan::ExpenseScanApp app(std::make_unique<expensescan::FileSystem>(),
                                    std::make_unique<expensescan::InvoiceParser>());
    return app.run(*config);
}
