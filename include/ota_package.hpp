/**
 * @file ota_package.hpp
 * @brief OTA Image Builder / Parser
 * 
 * OTA image = 512-byte OtaHeader + firmware (padded to 8 bytes with 0xFF).
 * The header crc covers everything after the crc field.
 * 
 * @version 1.0
 * @date 2026-10-19
 */

#ifndef OTA_PACKAGE_HPP
#define OTA_PACKAGE_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "ota_header.hpp"

// ==================== Result Types ====================

/**
 * @brief Human-readable view of a validated OTA image
 */
struct OtaSummary {
    std::string project_name;       /* Trailing NULs stripped */
    std::string version;            /* Trailing NULs stripped */
    uint64_t timestamp;             /* Epoch seconds */
    std::string build_time;         /* RFC 3339 (UTC), "Unknown" if out of range */
    uint32_t firmware_size;         /* Header size field */
    uint16_t crc;                   /* Stored (and verified) crc */
    size_t payload_length;          /* Bytes actually following the header */
};

struct OtaEncodeResult {
    bool success;
    OtaError error;
    std::string field;              /* Offending field for OTA_FIELD_TOO_LONG */
    std::string message;
    OtaHeader header;               /* Header as built, crc patched in */
    std::vector<uint8_t> image;     /* Header + padded firmware */
};

struct OtaDecodeResult {
    bool success;
    OtaError error;
    std::string message;
    uint16_t expected_crc;          /* Stored in header (OTA_CHECKSUM_MISMATCH) */
    uint16_t actual_crc;            /* Recomputed (OTA_CHECKSUM_MISMATCH) */
    OtaSummary summary;
};

// ==================== OTA Package Builder ====================

/**
 * @brief Frames a raw firmware binary into an OTA image
 */
class OtaPackageBuilder {
public:
    /**
     * @brief Constructor
     * @param project_name Firmware/project name (max 15 bytes)
     * @param version Build id, e.g. git short hash (max 31 bytes)
     */
    OtaPackageBuilder(const std::string& project_name, const std::string& version);
    
    /**
     * @brief Build OTA image stamped with the current time
     */
    OtaEncodeResult build(const std::vector<uint8_t>& firmware) const;
    
    /**
     * @brief Build OTA image with an explicit timestamp
     */
    OtaEncodeResult build(const std::vector<uint8_t>& firmware, uint64_t timestamp) const;
    
    /**
     * @brief Pad firmware with 0xFF up to the next 8-byte boundary
     */
    static std::vector<uint8_t> padFirmware(const std::vector<uint8_t>& firmware);

private:
    std::string project_name_;
    std::string version_;
    
    static bool copyField(const std::string& value, char* field, size_t field_size);
};

// ==================== OTA Package Parser ====================

/**
 * @brief Validates an OTA image held in memory
 * 
 * Check order: length, header parse, magic, crc.
 * The image buffer must outlive the parser.
 */
class OtaPackageParser {
public:
    explicit OtaPackageParser(const std::vector<uint8_t>& image);
    
    OtaDecodeResult decode() const;
    
    /**
     * @brief Firmware bytes following the header (nullptr if none)
     */
    const uint8_t* firmware() const;
    size_t firmwareSize() const;
    
    /**
     * @brief Format epoch seconds as RFC 3339 UTC ("Unknown" if not representable)
     */
    static std::string formatBuildTime(uint64_t timestamp);

private:
    const std::vector<uint8_t>& image_;
};

#endif // OTA_PACKAGE_HPP
