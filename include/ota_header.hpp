/**
 * @file ota_header.hpp
 * @brief OTA Image Header (512 bytes, little-endian)
 * 
 * Layout:
 *   0x000  magic_word    (4)    0xABCD5432
 *   0x004  crc           (2)    CRC-16/IBM-SDLC of bytes [0x006, end of image)
 *   0x006  version       (32)   Build id, NUL terminated
 *   0x026  project_name  (16)   Project name, NUL terminated
 *   0x036  timestamp     (8)    Epoch seconds at packaging time
 *   0x03E  size          (4)    Firmware size (padded), header not included
 *   0x042  reserved      (446)  Zero
 * 
 * @version 1.0
 * @date 2026-10-19
 */

#ifndef OTA_HEADER_HPP
#define OTA_HEADER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

// ==================== Constants ====================

#define OTA_MAGIC_WORD              0xABCD5432u
#define OTA_HEADER_SIZE             512

#define OTA_MAGIC_OFFSET            0
#define OTA_MAGIC_SIZE              4
#define OTA_CRC_OFFSET              4
#define OTA_CRC_SIZE                2
#define OTA_VERSION_OFFSET          6
#define OTA_VERSION_SIZE            32
#define OTA_PROJECT_NAME_OFFSET     38
#define OTA_PROJECT_NAME_SIZE       16
#define OTA_TIMESTAMP_OFFSET        54
#define OTA_TIMESTAMP_SIZE          8
#define OTA_SIZE_OFFSET             62
#define OTA_SIZE_SIZE               4
#define OTA_RESERVED_OFFSET         66
#define OTA_RESERVED_SIZE           446

// First byte covered by the checksum (magic and crc are excluded)
#define OTA_CRC_COVERAGE_OFFSET     (OTA_CRC_OFFSET + OTA_CRC_SIZE)

#define OTA_FIRMWARE_ALIGNMENT      8
#define OTA_FIRMWARE_PAD_BYTE       0xFF

static_assert(OTA_MAGIC_OFFSET + OTA_MAGIC_SIZE == OTA_CRC_OFFSET, "crc must follow magic");
static_assert(OTA_CRC_OFFSET + OTA_CRC_SIZE == OTA_VERSION_OFFSET, "version must follow crc");
static_assert(OTA_VERSION_OFFSET + OTA_VERSION_SIZE == OTA_PROJECT_NAME_OFFSET, "project_name must follow version");
static_assert(OTA_PROJECT_NAME_OFFSET + OTA_PROJECT_NAME_SIZE == OTA_TIMESTAMP_OFFSET, "timestamp must follow project_name");
static_assert(OTA_TIMESTAMP_OFFSET + OTA_TIMESTAMP_SIZE == OTA_SIZE_OFFSET, "size must follow timestamp");
static_assert(OTA_SIZE_OFFSET + OTA_SIZE_SIZE == OTA_RESERVED_OFFSET, "reserved must follow size");
static_assert(OTA_RESERVED_OFFSET + OTA_RESERVED_SIZE == OTA_HEADER_SIZE, "OTA header must be exactly 512 bytes");

// ==================== Type Definitions ====================

/**
 * @brief OTA packaging / validation error codes
 */
enum class OtaError : uint8_t {
    OTA_OK = 0,                 /* No error */
    OTA_FIELD_TOO_LONG = 1,     /* Name/version does not fit its header field */
    OTA_TOO_SHORT = 2,          /* Buffer smaller than the header */
    OTA_MALFORMED = 3,          /* Header bytes not interpretable */
    OTA_BAD_MAGIC = 4,          /* Not an OTA image */
    OTA_CHECKSUM_MISMATCH = 5   /* Header or firmware bytes corrupted */
};

/**
 * @brief Decoded OTA header
 * 
 * String fields keep their on-disk form (NUL padded). The reserved area
 * is not represented: it is written as zeros and ignored when parsing.
 */
struct OtaHeader {
    uint32_t magic_word;
    uint16_t crc;
    char     version[OTA_VERSION_SIZE];
    char     project_name[OTA_PROJECT_NAME_SIZE];
    uint64_t timestamp;
    uint32_t size;
};

// ==================== Header Codec ====================

/**
 * @brief Serialize header into its 512-byte on-disk form
 */
std::array<uint8_t, OTA_HEADER_SIZE> serializeOtaHeader(const OtaHeader& header);

/**
 * @brief Parse the first 512 bytes of a buffer into a header
 * 
 * Does not check magic or crc.
 * 
 * @param data Buffer start
 * @param size Buffer size (must be >= OTA_HEADER_SIZE)
 * @param header Output header
 * @return OTA_OK, OTA_TOO_SHORT or OTA_MALFORMED
 */
OtaError parseOtaHeader(const uint8_t* data, size_t size, OtaHeader& header);

/**
 * @brief Text of a fixed-size string field, up to the first NUL
 */
std::string otaFieldToString(const char* field, size_t field_size);

const char* otaErrorToString(OtaError error);

#endif // OTA_HEADER_HPP
