/**
 * @file ota_tool.hpp
 * @brief OTA Tool - encode / decode command orchestration
 * 
 * encode: cargo metadata -> git build id -> objcopy -> OTA image -> file
 * decode: file -> validation -> summary
 * 
 * @version 1.0
 * @date 2026-10-19
 */

#ifndef OTA_TOOL_HPP
#define OTA_TOOL_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "config_manager.hpp"
#include "ota_package.hpp"
#include "payload_digest.hpp"
#include "process_runner.hpp"

/**
 * @brief OTA Tool Class
 */
class OtaTool {
public:
    /**
     * @brief Constructor
     * @param config Configuration manager
     */
    explicit OtaTool(const ConfigManager& config);
    
    /**
     * @brief Package the firmware of a Cargo project
     * @param project_dir Directory holding Cargo.toml
     * @return true if the OTA file was written
     */
    bool encode(const std::string& project_dir);
    
    /**
     * @brief Package an already extracted firmware binary
     * @param output_path Destination OTA file
     * @return true if the OTA file was written
     */
    bool encodeFirmware(const std::string& project_name, const std::string& version,
                        const std::vector<uint8_t>& firmware, const std::string& output_path);
    
    /**
     * @brief Validate an OTA file and print its summary
     * @param file_path OTA image path
     * @param json_output Print the summary as JSON
     * @return true if the image is valid
     */
    bool decode(const std::string& file_path, bool json_output);
    
    /**
     * @brief "<project>-<version>-ota.bin"
     */
    static std::string outputFileName(const std::string& project_name, const std::string& version);
    
    /**
     * @brief Summary + digests as JSON text
     */
    static std::string summaryToJson(const OtaSummary& summary, const PayloadDigest& digest);

private:
    const ConfigManager& config_;
    ProcessRunner runner_;
    
    bool readFile(const std::string& path, std::vector<uint8_t>& data) const;
    bool writeFile(const std::string& path, const std::vector<uint8_t>& data) const;
    
    void printSummary(const OtaSummary& summary, const PayloadDigest& digest) const;
    void printHeader(const OtaHeader& header) const;
};

#endif // OTA_TOOL_HPP
