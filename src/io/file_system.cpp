#include "expensescan/io/file_system.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace expensescan {

auto FileSystem::read_text(const std::string& path) -> std::optional<std::string> {
    // Directories open as streams on some platforms and read back empty
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return oss.str();
}

auto FileSystem::read_stdin() -> std::string {
    std::ostringstream oss;
    std::string line;
    while (std::getline(std::cin, line)) {
        oss << line << '\n';
    }
    return oss.str();
}

auto FileSystem::write_text(const std::string& text, const std::string& path) -> bool {
    // Write to temporary file first for atomic replacement
    std::string temp_path = path + ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary);
        if (!file.is_open()) {
            return false;
        }
        file << text;
        if (file.fail()) {
            std::error_code cleanup_ec;
            std::filesystem::remove(temp_path, cleanup_ec);
            return false;
        }
    } // File automatically closed here

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        return false;
    }
    return true;
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

} // namespace expensescan
