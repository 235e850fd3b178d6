#pragma once

#include "expensescan/interfaces.hpp"
#include <string>

namespace expensescan {

class FileSystem : public IFileSystem {
public:
    auto read_text(const std::string& path) -> std::optional<std::string> override;
    auto read_stdin() -> std::string override;
    auto write_text(const std::string& text, const std::string& path) -> bool override;
    auto file_exists(const std::string& path) -> bool override;
};

} // namespace expensescan
