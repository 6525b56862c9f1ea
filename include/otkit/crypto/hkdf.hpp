#pragma once

#include "otkit/core/result.hpp"
#include "otkit/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace otkit::protocol::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) through the OpenSSL 3 EVP_KDF interface
 *
 * Extract and expand run as a single derivation. DeriveKey writes straight
 * into the caller's buffer, which lets callers target guarded memory.
 */
class Hkdf {
public:
    static Result<Unit, CipherFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, CipherFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace otkit::protocol::crypto
