/**
 * @file ota_header_codec.cpp
 * @brief OTA Header serialization / parsing
 * 
 * Fields are read and written at fixed byte offsets, little-endian,
 * independent of host struct layout.
 */

#include "ota_header.hpp"
#include <cstring>

namespace {

void writeLe16(uint8_t* out, uint16_t value) {
    out[0] = static_cast<uint8_t>(value & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

void writeLe32(uint8_t* out, uint32_t value) {
    for (int i = 0; i < 4; i++) {
        out[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

void writeLe64(uint8_t* out, uint64_t value) {
    for (int i = 0; i < 8; i++) {
        out[i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

uint16_t readLe16(const uint8_t* in) {
    return static_cast<uint16_t>(in[0] | (in[1] << 8));
}

uint32_t readLe32(const uint8_t* in) {
    uint32_t value = 0;
    for (int i = 3; i >= 0; i--) {
        value = (value << 8) | in[i];
    }
    return value;
}

uint64_t readLe64(const uint8_t* in) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; i--) {
        value = (value << 8) | in[i];
    }
    return value;
}

} // namespace

std::array<uint8_t, OTA_HEADER_SIZE> serializeOtaHeader(const OtaHeader& header) {
    std::array<uint8_t, OTA_HEADER_SIZE> bytes{};  // reserved + string tails stay zero

    writeLe32(&bytes[OTA_MAGIC_OFFSET], header.magic_word);
    writeLe16(&bytes[OTA_CRC_OFFSET], header.crc);
    std::memcpy(&bytes[OTA_VERSION_OFFSET], header.version, OTA_VERSION_SIZE);
    std::memcpy(&bytes[OTA_PROJECT_NAME_OFFSET], header.project_name, OTA_PROJECT_NAME_SIZE);
    writeLe64(&bytes[OTA_TIMESTAMP_OFFSET], header.timestamp);
    writeLe32(&bytes[OTA_SIZE_OFFSET], header.size);

    return bytes;
}

OtaError parseOtaHeader(const uint8_t* data, size_t size, OtaHeader& header) {
    if (size < OTA_HEADER_SIZE) {
        return OtaError::OTA_TOO_SHORT;
    }
    if (data == nullptr) {
        return OtaError::OTA_MALFORMED;
    }

    std::memset(&header, 0, sizeof(OtaHeader));
    header.magic_word = readLe32(data + OTA_MAGIC_OFFSET);
    header.crc = readLe16(data + OTA_CRC_OFFSET);
    std::memcpy(header.version, data + OTA_VERSION_OFFSET, OTA_VERSION_SIZE);
    std::memcpy(header.project_name, data + OTA_PROJECT_NAME_OFFSET, OTA_PROJECT_NAME_SIZE);
    header.timestamp = readLe64(data + OTA_TIMESTAMP_OFFSET);
    header.size = readLe32(data + OTA_SIZE_OFFSET);

    return OtaError::OTA_OK;
}

std::string otaFieldToString(const char* field, size_t field_size) {
    size_t length = 0;
    while (length < field_size && field[length] != '\0') {
        length++;
    }
    return std::string(field, length);
}

const char* otaErrorToString(OtaError error) {
    switch (error) {
        case OtaError::OTA_OK:                return "OK";
        case OtaError::OTA_FIELD_TOO_LONG:    return "FieldTooLong";
        case OtaError::OTA_TOO_SHORT:         return "TooShort";
        case OtaError::OTA_MALFORMED:         return "Malformed";
        case OtaError::OTA_BAD_MAGIC:         return "BadMagic";
        case OtaError::OTA_CHECKSUM_MISMATCH: return "ChecksumMismatch";
    }
    return "Unknown";
}
