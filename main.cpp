/**
 * @file main.cpp
 * @brief OTA Packer - Main Entry Point
 * 
 * Usage:
 *   ota_packer [--config <file>] encode <project-dir>
 *   ota_packer [--config <file>] decode <ota-file> [--json]
 * 
 * Also callable as a cargo subcommand (cargo hfmp ...).
 * 
 * @version 1.0
 * @date 2026-10-19
 */

#include <iostream>
#include <string>
#include <vector>
#include "config_manager.hpp"
#include "logger.hpp"
#include "ota_tool.hpp"

namespace {

const int kExitOk = 0;
const int kExitFailure = 1;
const int kExitUsage = 2;

void printUsage(const char* program) {
    std::cout << "Create or inspect OTA bin files for embedded firmware.\n"
              << "Run cargo build --release in the project directory before encoding.\n\n"
              << "Usage:\n"
              << "  " << program << " [--config <file>] encode <project-dir>\n"
              << "  " << program << " [--config <file>] decode <ota-file> [--json]\n\n"
              << "Commands:\n"
              << "  encode    Create the OTA bin file (<project>-<version>-ota.bin)\n"
              << "  decode    Validate an OTA bin file and print its header\n\n"
              << "Options:\n"
              << "  --config <file>   Configuration file (default: " << DEFAULT_CONFIG_FILE << ")\n"
              << "  --json            Print the decode summary as JSON\n"
              << "  -h, --help        Show this help\n";
}

} // namespace

// Main Entry Point
int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    
    // "cargo hfmp <cmd>" runs us as "ota_packer hfmp <cmd>"
    if (!args.empty() && args[0] == "hfmp") {
        args.erase(args.begin());
    }
    
    // Parse arguments
    std::string config_file = DEFAULT_CONFIG_FILE;
    bool config_required = false;
    bool json_output = false;
    std::vector<std::string> positional;
    
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return kExitOk;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= args.size()) {
                std::cerr << "[ERROR] --config needs a file argument\n";
                return kExitUsage;
            }
            config_file = args[++i];
            config_required = true;
        } else if (arg == "--json") {
            json_output = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "[ERROR] Unknown option: " << arg << "\n\n";
            printUsage(argv[0]);
            return kExitUsage;
        } else {
            positional.push_back(arg);
        }
    }
    
    if (positional.size() != 2 || (positional[0] != "encode" && positional[0] != "decode")) {
        printUsage(argv[0]);
        return kExitUsage;
    }
    const std::string& command = positional[0];
    const std::string& path = positional[1];
    
    if (json_output && command != "decode") {
        std::cerr << "[ERROR] --json only applies to decode\n";
        return kExitUsage;
    }
    
    // Load config
    ConfigManager config(config_file, config_required);
    if (!config.load()) {
        std::cerr << "[ERROR] Failed to load config\n";
        return kExitFailure;
    }
    
    LogLevel level = LogLevel::LOG_INFO;
    if (!Logger::parseLevel(config.getLogLevel(), level)) {
        std::cerr << "[CONFIG] Unknown log level '" << config.getLogLevel() << "', using info\n";
    }
    // Keep stdout clean for JSON output
    Logger::configure(level, config.isConsoleOutputEnabled() && !json_output);
    
    OtaTool tool(config);
    bool ok = (command == "encode") ? tool.encode(path) : tool.decode(path, json_output);
    
    return ok ? kExitOk : kExitFailure;
}
