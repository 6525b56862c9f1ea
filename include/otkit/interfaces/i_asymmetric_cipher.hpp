#pragma once
#include "otkit/core/result.hpp"
#include "otkit/core/failures.hpp"
#include "otkit/enums/cipher_suite.hpp"
#include "otkit/models/keys/public_key.hpp"
#include "otkit/models/keys/private_key.hpp"
#include "otkit/models/key_materials/asymmetric_key_pair.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace otkit::protocol::interfaces {
using protocol::Result;
using protocol::CipherFailure;
using enums::CipherSuite;
using models::AsymmetricKeyPair;
using models::PrivateKey;
using models::PublicKey;
/**
 * Semantically secure public-key encryption used by the transfer sessions.
 *
 * Implementations draw fresh randomness on every GenerateKeyPair and Encrypt
 * call. Decrypt under a key that does not match the encrypting public key
 * must fail rather than return bytes.
 */
class IAsymmetricCipher {
public:
    virtual ~IAsymmetricCipher() = default;
    [[nodiscard]] virtual CipherSuite GetSuite() const noexcept = 0;
    [[nodiscard]] virtual Result<AsymmetricKeyPair, CipherFailure> GenerateKeyPair(uint32_t key_bits) = 0;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, CipherFailure> Encrypt(
        const PublicKey& public_key,
        std::span<const uint8_t> plaintext) = 0;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, CipherFailure> Decrypt(
        const PrivateKey& private_key,
        std::span<const uint8_t> ciphertext) = 0;
    /// Largest plaintext Encrypt accepts under public_key.
    [[nodiscard]] virtual Result<size_t, CipherFailure> MaxPlaintextSize(const PublicKey& public_key) = 0;
};
}
