/**
 * @file payload_digest.hpp
 * @brief Firmware digests for diagnostics (CRC32 via zlib, SHA256 via OpenSSL)
 */

#ifndef PAYLOAD_DIGEST_HPP
#define PAYLOAD_DIGEST_HPP

#include <cstddef>
#include <cstdint>
#include <string>

struct PayloadDigest {
    uint32_t crc32;                 /* zlib crc32 */
    std::string sha256_hex;         /* Lowercase hex, 64 chars */
};

/**
 * @brief Calculate CRC32 and SHA256 of a firmware buffer
 * @return true if successful
 */
bool calculatePayloadDigest(const uint8_t* data, size_t size, PayloadDigest& digest);

#endif // PAYLOAD_DIGEST_HPP
