#pragma once

#include "otkit/core/result.hpp"
#include "otkit/core/failures.hpp"
#include "otkit/crypto/sodium_secure_memory_handle.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace otkit::protocol::crypto {

/// KyberInterop - RAII wrapper around liboqs Kyber-768 operations
///
/// Secret keys and shared secrets only ever live in SecureMemoryHandle.
/// liboqs randomness is rebound to libsodium's randombytes_buf on first use.
///
/// **Key Sizes (Kyber-768)**:
/// - Public Key:    1184 bytes
/// - Secret Key:    2400 bytes
/// - Ciphertext:    1088 bytes
/// - Shared Secret:   32 bytes
class KyberInterop {
public:
    static constexpr size_t KYBER_768_PUBLIC_KEY_SIZE = 1184;
    static constexpr size_t KYBER_768_SECRET_KEY_SIZE = 2400;
    static constexpr size_t KYBER_768_CIPHERTEXT_SIZE = 1088;
    static constexpr size_t KYBER_768_SHARED_SECRET_SIZE = 32;

    /// Generates a Kyber-768 key pair and runs an encapsulate/decapsulate
    /// self-test on it before returning.
    ///
    /// @return Pair of (secret key handle, public key bytes)
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>
    GenerateKeyPair();

    /// @return Pair of (KEM ciphertext, shared secret handle)
    static Result<std::pair<std::vector<uint8_t>, SecureMemoryHandle>, SodiumFailure>
    Encapsulate(std::span<const uint8_t> public_key);

    /// Kyber uses implicit rejection: a ciphertext made for another key still
    /// decapsulates, to an unrelated shared secret. Callers must authenticate
    /// whatever they derive from it.
    static Result<SecureMemoryHandle, SodiumFailure>
    Decapsulate(
        std::span<const uint8_t> ciphertext,
        const SecureMemoryHandle& secret_key_handle
    );

    static Result<Unit, SodiumFailure>
    ValidatePublicKey(std::span<const uint8_t> public_key);

    static Result<Unit, SodiumFailure>
    ValidateCiphertext(std::span<const uint8_t> ciphertext);

    static Result<Unit, SodiumFailure>
    ValidateSecretKey(const SecureMemoryHandle& secret_key_handle);

    static Result<Unit, SodiumFailure>
    SelfTestKeyPair(std::span<const uint8_t> public_key, const SecureMemoryHandle& secret_key_handle);

    /// Binds the liboqs RNG to libsodium. Safe to call multiple times.
    static Result<Unit, SodiumFailure> Initialize();

private:
    KyberInterop() = delete;
};

} // namespace otkit::protocol::crypto
