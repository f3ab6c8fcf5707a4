/**
 * @file ota_package_parser.cpp
 * @brief OTA Image Parser / Validator Implementation
 */

#include "ota_package.hpp"
#include "crc16.hpp"
#include <cstdio>
#include <ctime>
#include <limits>

OtaPackageParser::OtaPackageParser(const std::vector<uint8_t>& image)
    : image_(image) {
}

OtaDecodeResult OtaPackageParser::decode() const {
    OtaDecodeResult result;
    result.success = false;
    result.error = OtaError::OTA_OK;
    result.expected_crc = 0;
    result.actual_crc = 0;
    result.summary.timestamp = 0;
    result.summary.firmware_size = 0;
    result.summary.crc = 0;
    result.summary.payload_length = 0;
    
    // 1. Length
    if (image_.size() < OTA_HEADER_SIZE) {
        result.error = OtaError::OTA_TOO_SHORT;
        result.message = "file is too short to be an OTA image (" + std::to_string(image_.size()) +
                         " bytes, header alone is " + std::to_string(OTA_HEADER_SIZE) + ")";
        return result;
    }
    
    // 2. Header structure
    OtaHeader header;
    OtaError parse_error = parseOtaHeader(image_.data(), image_.size(), header);
    if (parse_error != OtaError::OTA_OK) {
        result.error = parse_error;
        result.message = std::string("invalid OTA header (") + otaErrorToString(parse_error) + ")";
        return result;
    }
    
    // 3. Magic
    if (header.magic_word != OTA_MAGIC_WORD) {
        char text[64];
        std::snprintf(text, sizeof(text), "invalid magic word 0x%08X (expected 0x%08X)",
                      header.magic_word, OTA_MAGIC_WORD);
        result.error = OtaError::OTA_BAD_MAGIC;
        result.message = text;
        return result;
    }
    
    // 4. Checksum over [6, end)
    uint16_t crc = crc16IbmSdlc(image_.data() + OTA_CRC_COVERAGE_OFFSET,
                                image_.size() - OTA_CRC_COVERAGE_OFFSET);
    if (crc != header.crc) {
        char text[64];
        std::snprintf(text, sizeof(text), "CRC mismatch, expected 0x%X, got 0x%X", header.crc, crc);
        result.error = OtaError::OTA_CHECKSUM_MISMATCH;
        result.expected_crc = header.crc;
        result.actual_crc = crc;
        result.message = text;
        return result;
    }
    
    // 5. Summary
    OtaSummary& summary = result.summary;
    summary.project_name = otaFieldToString(header.project_name, OTA_PROJECT_NAME_SIZE);
    summary.version = otaFieldToString(header.version, OTA_VERSION_SIZE);
    summary.timestamp = header.timestamp;
    summary.build_time = formatBuildTime(header.timestamp);
    summary.firmware_size = header.size;
    summary.crc = header.crc;
    summary.payload_length = image_.size() - OTA_HEADER_SIZE;
    
    result.expected_crc = header.crc;
    result.actual_crc = crc;
    result.success = true;
    return result;
}

const uint8_t* OtaPackageParser::firmware() const {
    if (image_.size() <= OTA_HEADER_SIZE) {
        return nullptr;
    }
    return image_.data() + OTA_HEADER_SIZE;
}

size_t OtaPackageParser::firmwareSize() const {
    return image_.size() > OTA_HEADER_SIZE ? image_.size() - OTA_HEADER_SIZE : 0;
}

std::string OtaPackageParser::formatBuildTime(uint64_t timestamp) {
    if (timestamp > static_cast<uint64_t>(std::numeric_limits<time_t>::max())) {
        return "Unknown";
    }
    
    time_t seconds = static_cast<time_t>(timestamp);
    struct tm utc;
    if (gmtime_r(&seconds, &utc) == nullptr) {
        return "Unknown";
    }
    
    char buffer[64];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S+00:00", &utc) == 0) {
        return "Unknown";
    }
    return buffer;
}
