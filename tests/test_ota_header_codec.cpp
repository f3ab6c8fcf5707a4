#include "ota_header.hpp"

#include <cassert>
#include <cstring>
#include <string>
#include <vector>

static OtaHeader make_header() {
    OtaHeader h;
    std::memset(&h, 0, sizeof(h));
    h.magic_word = OTA_MAGIC_WORD;
    h.crc = 0x1234;
    std::memcpy(h.version, "abc", 3);
    std::memcpy(h.project_name, "demo", 4);
    h.timestamp = 0x0102030405060708ull;
    h.size = 0x11223344u;
    return h;
}

int main() {
    OtaHeader h = make_header();
    auto bytes = serializeOtaHeader(h);
    assert(bytes.size() == 512);

    // magic, little-endian
    assert(bytes[0] == 0x32 && bytes[1] == 0x54 && bytes[2] == 0xCD && bytes[3] == 0xAB);
    // crc
    assert(bytes[4] == 0x34 && bytes[5] == 0x12);
    // version, zero padded
    assert(std::memcmp(&bytes[6], "abc", 3) == 0);
    for (size_t i = 9; i < 38; ++i) assert(bytes[i] == 0);
    // project name, zero padded
    assert(std::memcmp(&bytes[38], "demo", 4) == 0);
    for (size_t i = 42; i < 54; ++i) assert(bytes[i] == 0);
    // timestamp
    for (size_t i = 0; i < 8; ++i) assert(bytes[54 + i] == 8 - i);
    // size
    assert(bytes[62] == 0x44 && bytes[63] == 0x33 && bytes[64] == 0x22 && bytes[65] == 0x11);
    // reserved
    for (size_t i = 66; i < 512; ++i) assert(bytes[i] == 0);

    // Parse back, with trailing payload bytes present.
    std::vector<uint8_t> buffer(bytes.begin(), bytes.end());
    buffer.resize(600, 0xEE);
    OtaHeader parsed;
    assert(parseOtaHeader(buffer.data(), buffer.size(), parsed) == OtaError::OTA_OK);
    assert(parsed.magic_word == OTA_MAGIC_WORD);
    assert(parsed.crc == 0x1234);
    assert(parsed.timestamp == 0x0102030405060708ull);
    assert(parsed.size == 0x11223344u);
    assert(otaFieldToString(parsed.version, OTA_VERSION_SIZE) == "abc");
    assert(otaFieldToString(parsed.project_name, OTA_PROJECT_NAME_SIZE) == "demo");

    // Reserved bytes are ignored.
    buffer[100] = 0x5A;
    OtaHeader with_reserved;
    assert(parseOtaHeader(buffer.data(), buffer.size(), with_reserved) == OtaError::OTA_OK);
    assert(with_reserved.size == parsed.size);

    // Too short / no buffer.
    assert(parseOtaHeader(buffer.data(), 511, parsed) == OtaError::OTA_TOO_SHORT);
    assert(parseOtaHeader(buffer.data(), 0, parsed) == OtaError::OTA_TOO_SHORT);
    assert(parseOtaHeader(nullptr, 512, parsed) == OtaError::OTA_MALFORMED);

    // Field without a terminator is read up to its fixed size.
    char full[OTA_PROJECT_NAME_SIZE];
    std::memset(full, 'x', sizeof(full));
    assert(otaFieldToString(full, sizeof(full)) == std::string(16, 'x'));

    assert(std::string(otaErrorToString(OtaError::OTA_BAD_MAGIC)) == "BadMagic");
    assert(std::string(otaErrorToString(OtaError::OTA_CHECKSUM_MISMATCH)) == "ChecksumMismatch");
    assert(std::string(otaErrorToString(OtaError::OTA_FIELD_TOO_LONG)) == "FieldTooLong");

    return 0;
}
