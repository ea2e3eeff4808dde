#pragma once

#include <string>

namespace keystone::cli {

// Command result codes
enum class Result {
    Success = 0,
    InvalidArgs = 1,
    FileError = 2,
    InitializationError = 3,
    RuntimeError = 4
};

// keystone bringup [--settings <file>] [--fail <manager>]
// Bootstraps core services and brings up the demo session managers
Result cmd_bringup(const std::string& settings_path, const std::string& failing_manager);

// keystone report [--settings <file>] [--out <file>]
// Bootstraps and prints (or writes) the service health report
Result cmd_report(const std::string& settings_path, const std::string& out_path);

// keystone settings --write <file>
// Writes the default runtime settings
Result cmd_settings(const std::string& out_path);

// keystone help
void cmd_help();

} // namespace keystone::cli
