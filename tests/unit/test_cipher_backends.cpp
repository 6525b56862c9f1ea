#include <catch2/catch_test_macros.hpp>
#include "otkit/crypto/asymmetric_cipher_factory.hpp"
#include "otkit/crypto/rsa_oaep_cipher.hpp"
#include "otkit/crypto/kyber_aes_gcm_cipher.hpp"
#include "otkit/crypto/sodium_interop.hpp"
#include "otkit/core/constants.hpp"
#include <string>
using namespace otkit::protocol;
using namespace otkit::protocol::crypto;
using namespace otkit::protocol::models;
using otkit::protocol::enums::CipherSuite;

namespace {

struct BackendCase {
    CipherSuite suite;
    uint32_t key_bits;
    size_t max_plaintext;
};

std::vector<uint8_t> Bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

}

TEST_CASE("Cipher backends - Factory", "[cipher][factory]") {
    SECTION("RSA suite yields the RSA-OAEP backend") {
        auto cipher = CreateAsymmetricCipher(CipherSuite::RsaOaepSha256);
        REQUIRE(cipher.IsOk());
        REQUIRE(cipher.Unwrap()->GetSuite() == CipherSuite::RsaOaepSha256);
    }
    SECTION("Kyber suite yields the KEM-DEM backend") {
        auto cipher = CreateAsymmetricCipher(CipherSuite::Kyber768AesGcm);
        REQUIRE(cipher.IsOk());
        REQUIRE(cipher.Unwrap()->GetSuite() == CipherSuite::Kyber768AesGcm);
    }
    SECTION("Unknown suite value is rejected") {
        auto cipher = CreateAsymmetricCipher(static_cast<CipherSuite>(7));
        REQUIRE(cipher.IsErr());
        REQUIRE(cipher.UnwrapErr().type == CipherFailureType::Backend);
    }
}

TEST_CASE("Cipher backends - Contract", "[cipher][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const BackendCase cases[] = {
        {CipherSuite::RsaOaepSha256, RsaConstants::REFERENCE_MODULUS_BITS,
         RsaConstants::REFERENCE_MODULUS_BITS / 8 - RsaConstants::OAEP_SHA256_OVERHEAD},
        {CipherSuite::Kyber768AesGcm, KemDemConstants::KYBER_768_KEY_BITS, KemDemConstants::MAX_PLAINTEXT_SIZE},
    };

    for (const auto& backend : cases) {
        DYNAMIC_SECTION("Backend " << enums::ToString(backend.suite)) {
            auto cipher = CreateAsymmetricCipher(backend.suite).Unwrap();
            auto owner = cipher->GenerateKeyPair(backend.key_bits);
            auto other = cipher->GenerateKeyPair(backend.key_bits);
            REQUIRE(owner.IsOk());
            REQUIRE(other.IsOk());
            const auto message = Bytes("Hello Alice!");

            REQUIRE(owner.Unwrap().GetPublicKey().GetSuite() == backend.suite);
            REQUIRE(owner.Unwrap().GetPrivateKey().GetSuite() == backend.suite);
            REQUIRE(owner.Unwrap().GetPublicKey() != other.Unwrap().GetPublicKey());

            auto ciphertext = cipher->Encrypt(owner.Unwrap().GetPublicKey(), message);
            REQUIRE(ciphertext.IsOk());

            auto decrypted = cipher->Decrypt(owner.Unwrap().GetPrivateKey(), ciphertext.Unwrap());
            REQUIRE(decrypted.IsOk());
            REQUIRE(decrypted.Unwrap() == message);

            auto foreign = cipher->Decrypt(other.Unwrap().GetPrivateKey(), ciphertext.Unwrap());
            REQUIRE(foreign.IsErr());
            REQUIRE(foreign.UnwrapErr().type == CipherFailureType::Decryption);

            auto tampered = ciphertext.Unwrap();
            tampered.back() ^= 0x80;
            REQUIRE(cipher->Decrypt(owner.Unwrap().GetPrivateKey(), tampered).IsErr());

            auto second = cipher->Encrypt(owner.Unwrap().GetPublicKey(), message);
            REQUIRE(second.Unwrap() != ciphertext.Unwrap());

            auto max_size = cipher->MaxPlaintextSize(owner.Unwrap().GetPublicKey());
            REQUIRE(max_size.Unwrap() == backend.max_plaintext);

            std::vector<uint8_t> oversized(backend.max_plaintext + 1, 0x42);
            auto too_large = cipher->Encrypt(owner.Unwrap().GetPublicKey(), oversized);
            REQUIRE(too_large.IsErr());
            REQUIRE(too_large.UnwrapErr().type == CipherFailureType::Encoding);
        }
    }
}

TEST_CASE("Cipher backends - Key handling", "[cipher][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    RsaOaepCipher rsa;
    KyberAesGcmCipher kyber;

    SECTION("Destroyed private key cannot decrypt") {
        auto pair = rsa.GenerateKeyPair(RsaConstants::REFERENCE_MODULUS_BITS).Unwrap();
        auto ciphertext = rsa.Encrypt(pair.GetPublicKey(), Bytes("x")).Unwrap();
        PrivateKey private_key = std::move(pair).TakePrivateKey();
        private_key.Destroy();
        REQUIRE(private_key.IsDestroyed());
        auto result = rsa.Decrypt(private_key, ciphertext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CipherFailureType::InvalidKey);
    }
    SECTION("DiscardPrivateKey keeps only the public half") {
        auto pair = rsa.GenerateKeyPair(RsaConstants::REFERENCE_MODULUS_BITS).Unwrap();
        const PublicKey expected = pair.GetPublicKey();
        PublicKey kept = std::move(pair).DiscardPrivateKey();
        REQUIRE(kept == expected);
    }
    SECTION("Keys from another suite are rejected") {
        auto rsa_pair = rsa.GenerateKeyPair(RsaConstants::REFERENCE_MODULUS_BITS).Unwrap();
        auto result = kyber.Encrypt(rsa_pair.GetPublicKey(), Bytes("x"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CipherFailureType::InvalidKey);
        REQUIRE(kyber.Decrypt(rsa_pair.GetPrivateKey(), std::vector<uint8_t>(2000, 0)).IsErr());
    }
    SECTION("Kyber backend accepts only 768-bit parameters") {
        auto result = kyber.GenerateKeyPair(RsaConstants::DEFAULT_MODULUS_BITS);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CipherFailureType::KeyGeneration);
    }
    SECTION("KEM-DEM ciphertext layout") {
        auto pair = kyber.GenerateKeyPair(KemDemConstants::KYBER_768_KEY_BITS).Unwrap();
        const auto message = Bytes("Secret One!");
        auto ciphertext = kyber.Encrypt(pair.GetPublicKey(), message).Unwrap();
        REQUIRE(ciphertext.size() == KemDemConstants::CIPHERTEXT_OVERHEAD + message.size());
    }
    SECTION("Truncated KEM-DEM ciphertext is rejected") {
        auto pair = kyber.GenerateKeyPair(KemDemConstants::KYBER_768_KEY_BITS).Unwrap();
        std::vector<uint8_t> truncated(KemDemConstants::CIPHERTEXT_OVERHEAD - 1, 0x00);
        auto result = kyber.Decrypt(pair.GetPrivateKey(), truncated);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CipherFailureType::Decryption);
    }
}
