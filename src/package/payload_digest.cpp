/**
 * @file payload_digest.cpp
 * @brief Firmware digest implementation
 */

#include "payload_digest.hpp"
#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>
#include <zlib.h>
#include <openssl/evp.h>

namespace {

// zlib takes uInt lengths
const size_t kCrcChunk = std::numeric_limits<uInt>::max();

bool calculateSHA256(const uint8_t* data, size_t size, uint8_t* hash) {
    // Use EVP API (recommended in OpenSSL 3.0)
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        return false;
    }
    
    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(mdctx);
        return false;
    }
    
    if (size > 0 && EVP_DigestUpdate(mdctx, data, size) != 1) {
        EVP_MD_CTX_free(mdctx);
        return false;
    }
    
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
        EVP_MD_CTX_free(mdctx);
        return false;
    }
    
    EVP_MD_CTX_free(mdctx);
    return true;
}

} // namespace

bool calculatePayloadDigest(const uint8_t* data, size_t size, PayloadDigest& digest) {
    uLong crc = crc32(0L, Z_NULL, 0);
    size_t offset = 0;
    while (offset < size) {
        size_t chunk = std::min(size - offset, kCrcChunk);
        crc = crc32(crc, data + offset, static_cast<uInt>(chunk));
        offset += chunk;
    }
    digest.crc32 = static_cast<uint32_t>(crc);
    
    uint8_t hash[EVP_MAX_MD_SIZE];
    if (!calculateSHA256(data, size, hash)) {
        return false;
    }
    
    std::ostringstream hex;
    for (int i = 0; i < 32; i++) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    digest.sha256_hex = hex.str();
    return true;
}
