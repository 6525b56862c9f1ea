#pragma once

#include <cstdint>

namespace otkit::protocol::enums {

/**
 * @brief Public-key encryption scheme backing a transfer
 *
 * Both parties must agree on the suite; every key and ciphertext carries it.
 */
enum class CipherSuite : uint8_t {
    /// RSA with OAEP (SHA-256, MGF1-SHA-256), OpenSSL
    RsaOaepSha256 = 0,

    /// Kyber-768 KEM + HKDF-SHA256 + AES-256-GCM, liboqs and OpenSSL
    Kyber768AesGcm = 1
};

constexpr const char* ToString(const CipherSuite suite) noexcept {
    switch (suite) {
        case CipherSuite::RsaOaepSha256:
            return "RSA-OAEP-SHA256";
        case CipherSuite::Kyber768AesGcm:
            return "KYBER768-AES256GCM";
        default:
            return "UNKNOWN";
    }
}

} // namespace otkit::protocol::enums
