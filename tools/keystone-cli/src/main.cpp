#include "commands.hpp"
#include <cstring>
#include <iostream>
#include <string>

using namespace keystone::cli;

void print_version() {
    std::cout << "Keystone CLI v0.1.0\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return static_cast<int>(Result::InvalidArgs);
    }

    std::string command = argv[1];

    if (command == "--version" || command == "-v") {
        print_version();
        return 0;
    }

    if (command == "help" || command == "--help" || command == "-h") {
        cmd_help();
        return 0;
    }

    if (command == "bringup") {
        std::string settings_path;
        std::string failing_manager;

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--settings") == 0 && i + 1 < argc) {
                settings_path = argv[++i];
            } else if (std::strcmp(argv[i], "--fail") == 0 && i + 1 < argc) {
                failing_manager = argv[++i];
            } else {
                std::cerr << "Unknown option for 'bringup': " << argv[i] << "\n";
                return static_cast<int>(Result::InvalidArgs);
            }
        }

        return static_cast<int>(cmd_bringup(settings_path, failing_manager));
    }

    if (command == "report") {
        std::string settings_path;
        std::string out_path;

        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--settings") == 0 && i + 1 < argc) {
                settings_path = argv[++i];
            } else if (std::strcmp(argv[i], "--out") == 0 && i + 1 < argc) {
                out_path = argv[++i];
            } else {
                std::cerr << "Unknown option for 'report': " << argv[i] << "\n";
                return static_cast<int>(Result::InvalidArgs);
            }
        }

        return static_cast<int>(cmd_report(settings_path, out_path));
    }

    if (command == "settings") {
        if (argc < 4 || std::strcmp(argv[2], "--write") != 0) {
            std::cerr << "Error: 'keystone settings' requires --write <file>\n";
            std::cerr << "Usage: keystone settings --write <file>\n";
            return static_cast<int>(Result::InvalidArgs);
        }
        return static_cast<int>(cmd_settings(argv[3]));
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'keystone help' for usage information.\n";
    return static_cast<int>(Result::InvalidArgs);
}
