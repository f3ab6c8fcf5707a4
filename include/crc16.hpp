/**
 * @file crc16.hpp
 * @brief CRC-16/IBM-SDLC (X.25)
 * 
 * poly 0x1021 (reflected 0x8408), init 0xFFFF, refin/refout, xorout 0xFFFF.
 * Check value ("123456789"): 0x906E
 */

#ifndef CRC16_HPP
#define CRC16_HPP

#include <cstddef>
#include <cstdint>

#define CRC16_IBM_SDLC_INIT     0xFFFFu
#define CRC16_IBM_SDLC_XOROUT   0xFFFFu

/**
 * @brief Checksum of a whole buffer
 */
uint16_t crc16IbmSdlc(const uint8_t* data, size_t size);

/**
 * @brief Incremental form
 * 
 * Start with CRC16_IBM_SDLC_INIT, feed chunks through crc16IbmSdlcUpdate(),
 * then xor the register with CRC16_IBM_SDLC_XOROUT.
 */
uint16_t crc16IbmSdlcUpdate(uint16_t crc, const uint8_t* data, size_t size);

#endif // CRC16_HPP
