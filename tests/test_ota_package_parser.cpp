#include "ota_package.hpp"
#include "crc16.hpp"

#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

static std::vector<uint8_t> make_image() {
    OtaEncodeResult r = OtaPackageBuilder("demo", "abc123").build({0x01, 0x02, 0x03}, 1700000000ull);
    assert(r.success);
    return r.image;
}

static OtaDecodeResult decode(const std::vector<uint8_t>& image) {
    OtaPackageParser parser(image);
    return parser.decode();
}

int main() {
    const std::vector<uint8_t> image = make_image();

    // Round trip.
    OtaDecodeResult ok = decode(image);
    assert(ok.success);
    assert(ok.summary.project_name == "demo");
    assert(ok.summary.version == "abc123");
    assert(ok.summary.firmware_size == 8);
    assert(ok.summary.payload_length == 8);
    assert(ok.summary.timestamp == 1700000000ull);
    assert(ok.summary.build_time == "2023-11-14T22:13:20+00:00");
    assert(ok.summary.crc == crc16IbmSdlc(image.data() + 6, image.size() - 6));

    OtaPackageParser parser(image);
    assert(parser.firmwareSize() == 8);
    assert(parser.firmware() != nullptr && parser.firmware()[0] == 0x01);

    // Length boundary.
    std::vector<uint8_t> short_image(image.begin(), image.begin() + 511);
    assert(decode(short_image).error == OtaError::OTA_TOO_SHORT);
    assert(decode(std::vector<uint8_t>()).error == OtaError::OTA_TOO_SHORT);

    // Exactly 512 bytes of zeros / garbage: not our magic.
    assert(decode(std::vector<uint8_t>(512, 0x00)).error == OtaError::OTA_BAD_MAGIC);
    assert(decode(std::vector<uint8_t>(512, 0xFF)).error == OtaError::OTA_BAD_MAGIC);
    std::vector<uint8_t> garbage(512);
    uint32_t lcg = 12345;
    for (auto& b : garbage) {
        lcg = lcg * 1103515245u + 12345u;
        b = static_cast<uint8_t>(lcg >> 16);
    }
    garbage[0] = 0x00;  // keep the magic wrong whatever the generator yields
    assert(decode(garbage).error == OtaError::OTA_BAD_MAGIC);

    // Any single bit flip from offset 6 on is caught by the checksum.
    for (size_t offset = 6; offset < image.size(); ++offset) {
        for (int bit = 0; bit < 8; ++bit) {
            std::vector<uint8_t> corrupted = image;
            corrupted[offset] ^= static_cast<uint8_t>(1u << bit);
            OtaDecodeResult r = decode(corrupted);
            assert(!r.success);
            assert(r.error == OtaError::OTA_CHECKSUM_MISMATCH);
            assert(r.expected_crc == ok.summary.crc);
            assert(r.actual_crc != r.expected_crc);
        }
    }

    // Magic flips: BadMagic, even though the checksum over [6, end) still holds.
    for (size_t offset = 0; offset < 4; ++offset) {
        for (int bit = 0; bit < 8; ++bit) {
            std::vector<uint8_t> corrupted = image;
            corrupted[offset] ^= static_cast<uint8_t>(1u << bit);
            assert(decode(corrupted).error == OtaError::OTA_BAD_MAGIC);
        }
    }

    // crc field flips: stored value no longer matches the recomputed one.
    for (size_t offset = 4; offset < 6; ++offset) {
        std::vector<uint8_t> corrupted = image;
        corrupted[offset] ^= 0x01;
        OtaDecodeResult r = decode(corrupted);
        assert(r.error == OtaError::OTA_CHECKSUM_MISMATCH);
        assert(r.actual_crc == ok.summary.crc);
        assert(r.expected_crc != ok.summary.crc);
        assert(r.message.find("CRC mismatch") != std::string::npos);
    }

    // Header-only image.
    OtaEncodeResult empty = OtaPackageBuilder("e", "v").build({}, 0);
    OtaDecodeResult empty_decoded = decode(empty.image);
    assert(empty_decoded.success);
    assert(empty_decoded.summary.firmware_size == 0);
    OtaPackageParser empty_parser(empty.image);
    assert(empty_parser.firmware() == nullptr);
    assert(empty_parser.firmwareSize() == 0);

    // Build time formatting.
    assert(OtaPackageParser::formatBuildTime(0) == "1970-01-01T00:00:00+00:00");
    assert(OtaPackageParser::formatBuildTime(UINT64_MAX) == "Unknown");

    return 0;
}
