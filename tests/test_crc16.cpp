#include "crc16.hpp"

#include <cassert>
#include <cstring>

int main() {
    const char* check = "123456789";
    const uint8_t* data = reinterpret_cast<const uint8_t*>(check);
    const size_t len = std::strlen(check);

    // CRC-16/IBM-SDLC catalogue check value.
    assert(crc16IbmSdlc(data, len) == 0x906E);

    // init ^ xorout for an empty message.
    assert(crc16IbmSdlc(data, 0) == 0x0000);

    // Chunked update matches the one-shot result.
    uint16_t crc = CRC16_IBM_SDLC_INIT;
    crc = crc16IbmSdlcUpdate(crc, data, 4);
    crc = crc16IbmSdlcUpdate(crc, data + 4, len - 4);
    assert(static_cast<uint16_t>(crc ^ CRC16_IBM_SDLC_XOROUT) == 0x906E);

    // Single byte change is visible.
    uint8_t altered[9];
    std::memcpy(altered, data, len);
    altered[8] ^= 0x01;
    assert(crc16IbmSdlc(altered, len) != 0x906E);

    return 0;
}
