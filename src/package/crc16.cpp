/**
 * @file crc16.cpp
 * @brief CRC-16/IBM-SDLC (X.25), table driven
 */

#include "crc16.hpp"
#include <array>

namespace {

std::array<uint16_t, 256> buildTable() {
    std::array<uint16_t, 256> table{};
    for (uint32_t i = 0; i < 256; i++) {
        uint16_t crc = static_cast<uint16_t>(i);
        for (int bit = 0; bit < 8; bit++) {
            crc = (crc & 1u) ? static_cast<uint16_t>((crc >> 1) ^ 0x8408u)
                             : static_cast<uint16_t>(crc >> 1);
        }
        table[i] = crc;
    }
    return table;
}

const std::array<uint16_t, 256>& table() {
    static const std::array<uint16_t, 256> crc_table = buildTable();
    return crc_table;
}

} // namespace

uint16_t crc16IbmSdlcUpdate(uint16_t crc, const uint8_t* data, size_t size) {
    const auto& t = table();
    for (size_t i = 0; i < size; i++) {
        crc = static_cast<uint16_t>((crc >> 8) ^ t[(crc ^ data[i]) & 0xFFu]);
    }
    return crc;
}

uint16_t crc16IbmSdlc(const uint8_t* data, size_t size) {
    uint16_t crc = crc16IbmSdlcUpdate(CRC16_IBM_SDLC_INIT, data, size);
    return static_cast<uint16_t>(crc ^ CRC16_IBM_SDLC_XOROUT);
}
