#pragma once

#include "otkit/core/result.hpp"
#include "otkit/core/failures.hpp"
#include "otkit/core/constants.hpp"
#include "otkit/core/format.hpp"
#include "otkit/enums/cipher_suite.hpp"

#include <cstddef>
#include <cstdint>

namespace otkit::protocol::configuration {
using enums::CipherSuite;

/// Cipher suite and key size shared by both parties of a transfer
///
/// Sender and receiver must be created from equal configurations; the
/// receiver's offer carries the suite so a mismatch surfaces as
/// EncryptionFailed on the sender.
///
/// @example
/// ```cpp
/// auto config = OtConfig::Default();                 // RSA-OAEP, 2048-bit
/// auto pq = OtConfig::PostQuantum();                 // Kyber-768 + AES-256-GCM
/// auto custom = OtConfig::WithRsaModulusBits(3072);  // Result<OtConfig, OtFailure>
/// ```
class OtConfig {
public:
    /// 1024-bit RSA-OAEP. Matches the classic textbook parameters; fast, not
    /// a security target.
    [[nodiscard]] static constexpr OtConfig Reference() noexcept {
        return OtConfig(CipherSuite::RsaOaepSha256, RsaConstants::REFERENCE_MODULUS_BITS);
    }

    /// 2048-bit RSA-OAEP.
    [[nodiscard]] static constexpr OtConfig Default() noexcept {
        return OtConfig(CipherSuite::RsaOaepSha256, RsaConstants::DEFAULT_MODULUS_BITS);
    }

    [[nodiscard]] static constexpr OtConfig HighSecurity() noexcept {
        return OtConfig(CipherSuite::RsaOaepSha256, RsaConstants::HIGH_SECURITY_MODULUS_BITS);
    }

    /// Kyber-768 KEM with an AES-256-GCM payload
    ///
    /// Key generation costs far less than RSA, and there is no small payload
    /// ceiling.
    [[nodiscard]] static constexpr OtConfig PostQuantum() noexcept {
        return OtConfig(CipherSuite::Kyber768AesGcm, KemDemConstants::KYBER_768_KEY_BITS);
    }

    /// RSA-OAEP with a custom modulus size, multiple of 8 within [1024, 16384].
    [[nodiscard]] static Result<OtConfig, OtFailure> WithRsaModulusBits(const uint32_t modulus_bits) {
        if (modulus_bits < RsaConstants::MIN_MODULUS_BITS ||
            modulus_bits > RsaConstants::MAX_MODULUS_BITS ||
            modulus_bits % 8 != 0) {
            return Result<OtConfig, OtFailure>::Err(
                OtFailure::InvalidInput(
                    compat::format("RSA modulus must be a multiple of 8 in [{}, {}], got {}",
                        RsaConstants::MIN_MODULUS_BITS, RsaConstants::MAX_MODULUS_BITS, modulus_bits)));
        }
        return Result<OtConfig, OtFailure>::Ok(OtConfig(CipherSuite::RsaOaepSha256, modulus_bits));
    }

    [[nodiscard]] constexpr CipherSuite GetSuite() const noexcept {
        return suite_;
    }

    /// RSA modulus bits, or the Kyber parameter (768).
    [[nodiscard]] constexpr uint32_t GetKeyBits() const noexcept {
        return key_bits_;
    }

    [[nodiscard]] constexpr bool IsPostQuantum() const noexcept {
        return suite_ == CipherSuite::Kyber768AesGcm;
    }

    /// Largest message either slot can carry under this configuration
    ///
    /// - RSA-OAEP-SHA256: modulus bytes - 66 (62 bytes at 1024 bits)
    /// - Kyber-768 KEM-DEM: fixed 256 KiB
    [[nodiscard]] constexpr size_t EstimateMaxMessageSize() const noexcept {
        switch (suite_) {
            case CipherSuite::RsaOaepSha256:
                return key_bits_ / 8 - RsaConstants::OAEP_SHA256_OVERHEAD;
            case CipherSuite::Kyber768AesGcm:
                return KemDemConstants::MAX_PLAINTEXT_SIZE;
        }
        return 0;
    }

    [[nodiscard]] constexpr bool operator==(const OtConfig& other) const noexcept {
        return suite_ == other.suite_ && key_bits_ == other.key_bits_;
    }

    [[nodiscard]] constexpr bool operator!=(const OtConfig& other) const noexcept {
        return !(*this == other);
    }

private:
    constexpr OtConfig(const CipherSuite suite, const uint32_t key_bits) noexcept
        : suite_(suite), key_bits_(key_bits) {}

    CipherSuite suite_;
    uint32_t key_bits_;
};

} // namespace otkit::protocol::configuration
