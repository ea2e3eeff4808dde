#pragma once

#include <string>

namespace keystone::core {

struct FileSystem {
    static bool exists(const std::string& path);
    // Empty string when the file cannot be opened
    static std::string read_text(const std::string& path);
    static bool write_text(const std::string& path, const std::string& text);
};

} // namespace keystone::core
