#pragma once

#include "expensescan/application/expensescan_app.hpp"
#include <optional>
#include <string>
#include <vector>

namespace expensescan {

// Percentage in [0, 100]; anything else (including nan and trailing junk) is rejected
auto parse_confidence(const std::string& value) -> std::optional<double>;

// `args` excludes the program name. Problems are reported on stderr and
// yield std::nullopt; --help sets Config::show_help and stops parsing.
auto parse_args(const std::vector<std::string>& args) -> std::optional<Config>;

auto usage_text() -> std::string;

} // namespace expensescan
