#pragma once
#include "otkit/core/result.hpp"
#include "otkit/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace otkit::protocol::crypto {

/**
 * AES-256-GCM authenticated encryption over OpenSSL EVP
 *
 * Stateless primitive. The caller owns nonce uniqueness per key; the KEM-DEM
 * backend derives a fresh key for every message, so a random nonce is enough
 * there.
 *
 * Output layout of Encrypt: ciphertext || tag (16 bytes).
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CipherFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    /// Tag mismatch is reported as CipherFailureType::Decryption.
    [[nodiscard]] static Result<std::vector<uint8_t>, CipherFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
