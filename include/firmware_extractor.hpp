/**
 * @file firmware_extractor.hpp
 * @brief ELF -> raw binary extraction (objcopy)
 */

#ifndef FIRMWARE_EXTRACTOR_HPP
#define FIRMWARE_EXTRACTOR_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "config_manager.hpp"
#include "process_runner.hpp"

class FirmwareExtractor {
public:
    FirmwareExtractor(const ConfigManager& config, const ProcessRunner& runner);
    
    /**
     * @brief Convert ELF to a raw image and load it
     * 
     * The intermediate file is written to work_dir and removed afterwards.
     * 
     * @param elf_path Linked firmware ELF
     * @param work_dir Directory for the intermediate binary
     * @param firmware Output firmware bytes
     * @return true if successful
     */
    bool extract(const std::string& elf_path, const std::string& work_dir,
                 std::vector<uint8_t>& firmware) const;
    
    /**
     * @brief objcopy command line for the given paths
     */
    std::vector<std::string> buildCommand(const std::string& elf_path, const std::string& output_path) const;

private:
    const ConfigManager& config_;
    const ProcessRunner& runner_;
};

#endif // FIRMWARE_EXTRACTOR_HPP
