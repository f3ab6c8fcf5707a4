/**
 * @file firmware_extractor.cpp
 * @brief ELF -> raw binary extraction implementation
 */

#include "firmware_extractor.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>

FirmwareExtractor::FirmwareExtractor(const ConfigManager& config, const ProcessRunner& runner)
    : config_(config), runner_(runner) {
}

std::vector<std::string> FirmwareExtractor::buildCommand(const std::string& elf_path,
                                                         const std::string& output_path) const {
    return {
        config_.getObjcopy(),
        "-I", config_.getObjcopyInputTarget(),
        "-O", config_.getObjcopyOutputTarget(),
        elf_path,
        output_path
    };
}

bool FirmwareExtractor::extract(const std::string& elf_path, const std::string& work_dir,
                                std::vector<uint8_t>& firmware) const {
    const std::string temp_path = work_dir + "/" + config_.getTempFileName();
    const std::string objcopy = config_.getObjcopy();
    
    Logger::info() << "[OBJCOPY] " << elf_path << " -> " << temp_path << "\n";
    
    ProcessResult result = runner_.run(buildCommand(elf_path, temp_path), work_dir, true);
    if (!result.spawned) {
        Logger::error() << "[OBJCOPY] ✗ " << result.error << "\n";
        Logger::error() << "[OBJCOPY]   Is " << objcopy << " installed and on PATH?"
                        << " (e.g. install the arm-none-eabi binutils)\n";
        return false;
    }
    if (result.exit_code != 0) {
        Logger::error() << "[OBJCOPY] ✗ objcopy failed, exit status " << result.exit_code << "\n";
        std::remove(temp_path.c_str());
        return false;
    }
    Logger::info() << "[OBJCOPY] ✓ objcopy success\n";
    
    std::ifstream file(temp_path, std::ios::binary);
    if (!file.is_open()) {
        Logger::error() << "[OBJCOPY] ✗ Failed to open " << temp_path << "\n";
        return false;
    }
    firmware.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    bool read_ok = !file.bad();
    file.close();
    
    if (std::remove(temp_path.c_str()) != 0) {
        Logger::warn() << "[OBJCOPY] ⚠️  Failed to remove " << temp_path << ": " << std::strerror(errno) << "\n";
    }
    
    if (!read_ok) {
        Logger::error() << "[OBJCOPY] ✗ Failed to read " << temp_path << "\n";
        return false;
    }
    
    Logger::info() << "[OBJCOPY] Firmware: " << firmware.size() << " bytes\n";
    return true;
}
