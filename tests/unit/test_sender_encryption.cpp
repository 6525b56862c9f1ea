#include <catch2/catch_test_macros.hpp>
#include "otkit/protocol/transfer/ot_sender.hpp"
#include "otkit/crypto/sodium_interop.hpp"
#include "../helpers/mock_asymmetric_cipher.hpp"
#include <string>
using namespace otkit::protocol;
using namespace otkit::protocol::transfer;
using namespace otkit::protocol::test_helpers;

namespace {

std::vector<uint8_t> Bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

struct Fixture {
    std::shared_ptr<MockAsymmetricCipher> cipher = std::make_shared<MockAsymmetricCipher>();
    AsymmetricKeyPair key0 = cipher->GenerateKeyPair(0).Unwrap();
    AsymmetricKeyPair key1 = cipher->GenerateKeyPair(0).Unwrap();

    ReceiverPublicKeys Offer() const {
        return ReceiverPublicKeys(key0.GetPublicKey(), key1.GetPublicKey());
    }

    std::unique_ptr<ObliviousTransferSender> Sender(const std::string& m0, const std::string& m1) {
        auto result = ObliviousTransferSender::Create(Bytes(m0), Bytes(m1), OtConfig::Reference(), cipher);
        REQUIRE(result.IsOk());
        return std::move(result).Unwrap();
    }
};

}

TEST_CASE("Sender - Slot i carries message i", "[sender][encryption]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    Fixture fx;
    auto sender = fx.Sender("Hello Alice!", "Hello Bob!!");
    REQUIRE(sender->GetPhase() == SenderPhase::Init);

    auto response = sender->EncryptMessages(fx.Offer());
    REQUIRE(response.IsOk());
    REQUIRE(sender->GetPhase() == SenderPhase::Encrypted);

    SECTION("Each ciphertext opens under its own slot key") {
        auto plain0 = fx.cipher->Decrypt(fx.key0.GetPrivateKey(), response.Unwrap().Ciphertext0());
        auto plain1 = fx.cipher->Decrypt(fx.key1.GetPrivateKey(), response.Unwrap().Ciphertext1());
        REQUIRE(plain0.Unwrap() == Bytes("Hello Alice!"));
        REQUIRE(plain1.Unwrap() == Bytes("Hello Bob!!"));
    }
    SECTION("Crossed keys do not open") {
        REQUIRE(fx.cipher->Decrypt(fx.key1.GetPrivateKey(), response.Unwrap().Ciphertext0()).IsErr());
        REQUIRE(fx.cipher->Decrypt(fx.key0.GetPrivateKey(), response.Unwrap().Ciphertext1()).IsErr());
    }
    SECTION("Both slots were encrypted") {
        REQUIRE(fx.cipher->EncryptCallCount() == 2);
    }
}

TEST_CASE("Sender - Encryption failures", "[sender][encryption][errors]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Oversized message in slot 1 names slot 1") {
        Fixture fx;
        fx.cipher->SetMaxPlaintext(8);
        auto sender = fx.Sender("short", "this is far too long");
        auto response = sender->EncryptMessages(fx.Offer());
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().type == OtFailureType::EncryptionFailed);
        REQUIRE(response.UnwrapErr().slot == std::optional<uint8_t>(1));
        REQUIRE(sender->GetPhase() == SenderPhase::Aborted);
    }
    SECTION("Both slots failing reports slot 0") {
        Fixture fx;
        fx.cipher->SetMaxPlaintext(4);
        auto sender = fx.Sender("too long 0", "too long 1");
        auto response = sender->EncryptMessages(fx.Offer());
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().slot == std::optional<uint8_t>(0));
    }
    SECTION("Key rejected by the backend names its slot") {
        Fixture fx;
        fx.cipher->FailEncryptionFor(fx.key0.GetPublicKey());
        auto sender = fx.Sender("m0", "m1");
        auto response = sender->EncryptMessages(fx.Offer());
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().slot == std::optional<uint8_t>(0));

        const auto attempts = fx.cipher->EncryptAttempts();
        REQUIRE(attempts.size() == 2);
        REQUIRE(attempts[0] == fx.key0.GetPublicKey());
        REQUIRE(attempts[1] == fx.key1.GetPublicKey());
        REQUIRE(fx.cipher->EncryptCallCount() == 1);
    }
    SECTION("Slot 1 is still encrypted after slot 0 fails on size") {
        Fixture fx;
        fx.cipher->SetMaxPlaintext(8);
        auto sender = fx.Sender("this is far too long", "short");
        auto response = sender->EncryptMessages(fx.Offer());
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().slot == std::optional<uint8_t>(0));
        REQUIRE(fx.cipher->EncryptAttempts().size() == 2);
        REQUIRE(fx.cipher->EncryptCallCount() == 1);
    }
    SECTION("Offer from another suite is rejected") {
        Fixture fx;
        auto sender = fx.Sender("m0", "m1");
        ReceiverPublicKeys foreign(
            PublicKey(CipherSuite::Kyber768AesGcm, fx.key0.GetPublicKey().GetBytesCopy()),
            PublicKey(CipherSuite::Kyber768AesGcm, fx.key1.GetPublicKey().GetBytesCopy()));
        auto response = sender->EncryptMessages(foreign);
        REQUIRE(response.IsErr());
        REQUIRE(response.UnwrapErr().type == OtFailureType::EncryptionFailed);
    }
    SECTION("Empty messages are allowed") {
        Fixture fx;
        auto sender = fx.Sender("", "");
        auto response = sender->EncryptMessages(fx.Offer());
        REQUIRE(response.IsOk());
        REQUIRE(fx.cipher->Decrypt(fx.key0.GetPrivateKey(), response.Unwrap().Ciphertext0()).Unwrap().empty());
    }
}

TEST_CASE("Sender - Session construction", "[sender][validation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Null cipher is rejected") {
        auto sender = ObliviousTransferSender::Create(Bytes("a"), Bytes("b"), OtConfig::Reference(), nullptr);
        REQUIRE(sender.IsErr());
        REQUIRE(sender.UnwrapErr().type == OtFailureType::InvalidInput);
    }
    SECTION("Cipher of another suite is rejected") {
        auto sender = ObliviousTransferSender::Create(
            Bytes("a"), Bytes("b"), OtConfig::Default(),
            std::make_shared<MockAsymmetricCipher>(CipherSuite::Kyber768AesGcm));
        REQUIRE(sender.IsErr());
        REQUIRE(sender.UnwrapErr().type == OtFailureType::InvalidInput);
    }
    SECTION("Configured backend is used when none is given") {
        auto sender = ObliviousTransferSender::Create(Bytes("a"), Bytes("b"), OtConfig::PostQuantum());
        REQUIRE(sender.IsOk());
        REQUIRE(sender.Unwrap()->GetConfig() == OtConfig::PostQuantum());
    }
}
