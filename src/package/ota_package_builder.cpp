/**
 * @file ota_package_builder.cpp
 * @brief OTA Image Builder Implementation
 */

#include "ota_package.hpp"
#include "crc16.hpp"
#include <cstring>
#include <ctime>
#include <limits>

OtaPackageBuilder::OtaPackageBuilder(const std::string& project_name, const std::string& version)
    : project_name_(project_name), version_(version) {
}

OtaEncodeResult OtaPackageBuilder::build(const std::vector<uint8_t>& firmware) const {
    return build(firmware, static_cast<uint64_t>(std::time(nullptr)));
}

OtaEncodeResult OtaPackageBuilder::build(const std::vector<uint8_t>& firmware, uint64_t timestamp) const {
    OtaEncodeResult result;
    result.success = false;
    result.error = OtaError::OTA_OK;
    std::memset(&result.header, 0, sizeof(OtaHeader));
    
    OtaHeader& header = result.header;
    
    // 1. Field capacity (a NUL terminator is always stored)
    if (!copyField(project_name_, header.project_name, OTA_PROJECT_NAME_SIZE)) {
        result.error = OtaError::OTA_FIELD_TOO_LONG;
        result.field = "project_name";
        result.message = "project name '" + project_name_ + "' is " + std::to_string(project_name_.size()) +
                         " bytes, max " + std::to_string(OTA_PROJECT_NAME_SIZE - 1);
        return result;
    }
    if (!copyField(version_, header.version, OTA_VERSION_SIZE)) {
        result.error = OtaError::OTA_FIELD_TOO_LONG;
        result.field = "version";
        result.message = "version '" + version_ + "' is " + std::to_string(version_.size()) +
                         " bytes, max " + std::to_string(OTA_VERSION_SIZE - 1);
        return result;
    }
    
    // 2. Pad firmware
    std::vector<uint8_t> padded = padFirmware(firmware);
    if (padded.size() > std::numeric_limits<uint32_t>::max()) {
        result.error = OtaError::OTA_FIELD_TOO_LONG;
        result.field = "size";
        result.message = "firmware of " + std::to_string(padded.size()) + " bytes does not fit a 32-bit size";
        return result;
    }
    
    // 3. Header with placeholder crc
    header.magic_word = OTA_MAGIC_WORD;
    header.crc = 0;
    header.timestamp = timestamp;
    header.size = static_cast<uint32_t>(padded.size());
    
    // 4. Header + firmware
    const auto header_bytes = serializeOtaHeader(header);
    result.image.reserve(OTA_HEADER_SIZE + padded.size());
    result.image.insert(result.image.end(), header_bytes.begin(), header_bytes.end());
    result.image.insert(result.image.end(), padded.begin(), padded.end());
    
    // 5-6. crc over [6, end), patched into bytes 4..5 of the image itself
    uint16_t crc = crc16IbmSdlc(result.image.data() + OTA_CRC_COVERAGE_OFFSET,
                                result.image.size() - OTA_CRC_COVERAGE_OFFSET);
    result.image[OTA_CRC_OFFSET] = static_cast<uint8_t>(crc & 0xFF);
    result.image[OTA_CRC_OFFSET + 1] = static_cast<uint8_t>((crc >> 8) & 0xFF);
    header.crc = crc;
    
    result.success = true;
    return result;
}

std::vector<uint8_t> OtaPackageBuilder::padFirmware(const std::vector<uint8_t>& firmware) {
    std::vector<uint8_t> padded(firmware);
    size_t remainder = padded.size() % OTA_FIRMWARE_ALIGNMENT;
    if (remainder != 0) {
        padded.resize(padded.size() + (OTA_FIRMWARE_ALIGNMENT - remainder), OTA_FIRMWARE_PAD_BYTE);
    }
    return padded;
}

bool OtaPackageBuilder::copyField(const std::string& value, char* field, size_t field_size) {
    if (value.size() > field_size - 1) {
        return false;
    }
    std::memset(field, 0, field_size);
    std::memcpy(field, value.data(), value.size());
    return true;
}
