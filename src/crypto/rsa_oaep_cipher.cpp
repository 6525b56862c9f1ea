#include "otkit/crypto/rsa_oaep_cipher.hpp"
#include "otkit/crypto/rsa_interop.hpp"
#include "otkit/core/format.hpp"

namespace otkit::protocol::crypto {
using enums::CipherSuite;
using models::AsymmetricKeyPair;
using models::PrivateKey;
using models::PublicKey;

namespace {
    Result<Unit, CipherFailure> CheckSuite(const CipherSuite actual, const char* what) {
        if (actual != CipherSuite::RsaOaepSha256) {
            return Result<Unit, CipherFailure>::Err(
                CipherFailure::InvalidKey(
                    compat::format("{} belongs to suite {}, expected {}",
                        what, enums::ToString(actual), enums::ToString(CipherSuite::RsaOaepSha256))));
        }
        return Result<Unit, CipherFailure>::Ok(unit);
    }
}

Result<AsymmetricKeyPair, CipherFailure> RsaOaepCipher::GenerateKeyPair(const uint32_t key_bits) {
    auto generated = RsaInterop::GenerateKeyPair(key_bits);
    if (generated.IsErr()) {
        return Result<AsymmetricKeyPair, CipherFailure>::Err(generated.UnwrapErr());
    }
    auto [secret_handle, public_der] = std::move(generated).Unwrap();
    return Result<AsymmetricKeyPair, CipherFailure>::Ok(
        AsymmetricKeyPair(
            PublicKey(CipherSuite::RsaOaepSha256, std::move(public_der)),
            PrivateKey(CipherSuite::RsaOaepSha256, std::move(secret_handle))));
}

Result<std::vector<uint8_t>, CipherFailure> RsaOaepCipher::Encrypt(
    const PublicKey& public_key,
    std::span<const uint8_t> plaintext) {
    auto suite_check = CheckSuite(public_key.GetSuite(), "Public key");
    if (suite_check.IsErr()) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(suite_check.UnwrapErr());
    }
    return RsaInterop::EncryptOaep(public_key.GetBytes(), plaintext);
}

Result<std::vector<uint8_t>, CipherFailure> RsaOaepCipher::Decrypt(
    const PrivateKey& private_key,
    std::span<const uint8_t> ciphertext) {
    auto suite_check = CheckSuite(private_key.GetSuite(), "Private key");
    if (suite_check.IsErr()) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(suite_check.UnwrapErr());
    }
    if (private_key.IsDestroyed()) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::InvalidKey("Private key has been destroyed"));
    }
    return RsaInterop::DecryptOaep(private_key.GetSecretKeyHandle(), ciphertext);
}

Result<size_t, CipherFailure> RsaOaepCipher::MaxPlaintextSize(const PublicKey& public_key) {
    auto suite_check = CheckSuite(public_key.GetSuite(), "Public key");
    if (suite_check.IsErr()) {
        return Result<size_t, CipherFailure>::Err(suite_check.UnwrapErr());
    }
    return RsaInterop::MaxPlaintextSize(public_key.GetBytes());
}

} // namespace otkit::protocol::crypto
