#include <catch2/catch_test_macros.hpp>
#include "otkit/protocol/transfer/ot_receiver.hpp"
#include "otkit/protocol/transfer/ot_sender.hpp"
#include "otkit/crypto/sodium_interop.hpp"
#include "otkit/core/constants.hpp"
#include "../helpers/mock_asymmetric_cipher.hpp"
#include <string>

using namespace otkit::protocol;
using namespace otkit::protocol::transfer;
using namespace otkit::protocol::test_helpers;
using otkit::protocol::enums::Choice;

namespace {

std::vector<uint8_t> Bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

auto CreateReceiver(const Choice choice, std::shared_ptr<MockAsymmetricCipher> cipher) {
    auto result = ObliviousTransferReceiver::Create(choice, OtConfig::Reference(), std::move(cipher));
    REQUIRE(result.IsOk());
    return std::move(result).Unwrap();
}

auto CreateSender(std::shared_ptr<MockAsymmetricCipher> cipher) {
    auto result = ObliviousTransferSender::Create(
        Bytes("Secret Zero"), Bytes("Secret One!"), OtConfig::Reference(), std::move(cipher));
    REQUIRE(result.IsOk());
    return std::move(result).Unwrap();
}

bool IsStateError(const OtFailure& failure) {
    return failure.type == OtFailureType::ProtocolStateError;
}

}

TEST_CASE("State transitions - Receiver happy path", "[boundaries][state][receiver]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto cipher = std::make_shared<MockAsymmetricCipher>();
    auto receiver = CreateReceiver(Choice::One, cipher);
    auto sender = CreateSender(cipher);

    REQUIRE(receiver->GetPhase() == ReceiverPhase::Init);
    auto offer = receiver->GeneratePublicKeys();
    REQUIRE(offer.IsOk());
    REQUIRE(receiver->GetPhase() == ReceiverPhase::KeysGenerated);

    auto response = sender->EncryptMessages(offer.Unwrap());
    REQUIRE(response.IsOk());

    auto message = receiver->DecryptMessage(response.Unwrap());
    REQUIRE(message.IsOk());
    REQUIRE(message.Unwrap() == Bytes("Secret One!"));
    REQUIRE(receiver->GetPhase() == ReceiverPhase::Decrypted);
}

TEST_CASE("State transitions - Receiver out-of-order calls", "[boundaries][state][receiver]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto cipher = std::make_shared<MockAsymmetricCipher>();

    SECTION("Decrypt before key generation is a state error and aborts") {
        auto receiver = CreateReceiver(Choice::Zero, cipher);
        SenderResponse response(Bytes("c0"), Bytes("c1"));
        auto result = receiver->DecryptMessage(response);
        REQUIRE(result.IsErrAnd(IsStateError));
        REQUIRE(result.UnwrapErr().message == std::string(ErrorMessages::KEYS_NOT_GENERATED));
        REQUIRE(receiver->GetPhase() == ReceiverPhase::Aborted);
    }
    SECTION("Generating keys twice is a state error and wipes the first key") {
        auto receiver = CreateReceiver(Choice::Zero, cipher);
        REQUIRE(receiver->GeneratePublicKeys().IsOk());
        REQUIRE(receiver->RetainedPrivateKeyCount() == 1);
        auto second = receiver->GeneratePublicKeys();
        REQUIRE(second.IsErrAnd(IsStateError));
        REQUIRE(receiver->GetPhase() == ReceiverPhase::Aborted);
        REQUIRE(receiver->RetainedPrivateKeyCount() == 0);
        REQUIRE(cipher->GeneratedKeyCount() == 2);
    }
    SECTION("Decrypting twice is a state error") {
        auto receiver = CreateReceiver(Choice::Zero, cipher);
        auto sender = CreateSender(cipher);
        auto response = sender->EncryptMessages(receiver->GeneratePublicKeys().Unwrap()).Unwrap();
        REQUIRE(receiver->DecryptMessage(response).IsOk());
        auto again = receiver->DecryptMessage(response);
        REQUIRE(again.IsErrAnd(IsStateError));
        REQUIRE(again.UnwrapErr().message == std::string(ErrorMessages::SESSION_COMPLETED));
        REQUIRE(receiver->GetPhase() == ReceiverPhase::Aborted);
    }
    SECTION("Aborted session rejects everything") {
        auto receiver = CreateReceiver(Choice::Zero, cipher);
        SenderResponse response(Bytes("c0"), Bytes("c1"));
        REQUIRE(receiver->DecryptMessage(response).IsErr());
        auto keys = receiver->GeneratePublicKeys();
        REQUIRE(keys.IsErrAnd(IsStateError));
        REQUIRE(keys.UnwrapErr().message == std::string(ErrorMessages::SESSION_ABORTED));
        REQUIRE(receiver->GetPhase() == ReceiverPhase::Aborted);
    }
    SECTION("Probing outside KeysGenerated is a state error without aborting") {
        auto receiver = CreateReceiver(Choice::Zero, cipher);
        auto probe = receiver->CanDecryptFor(PublicKey(CipherSuite::RsaOaepSha256, Bytes("k")));
        REQUIRE(probe.IsErrAnd(IsStateError));
        REQUIRE(receiver->GetPhase() == ReceiverPhase::Init);
    }
}

TEST_CASE("State transitions - Receiver decryption failure", "[boundaries][state][receiver]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto cipher = std::make_shared<MockAsymmetricCipher>();
    auto receiver = CreateReceiver(Choice::One, cipher);
    REQUIRE(receiver->GeneratePublicKeys().IsOk());

    SECTION("Garbage ciphertext aborts with DecryptionFailed") {
        SenderResponse response(Bytes("irrelevant"), Bytes("not a ciphertext for this key"));
        auto result = receiver->DecryptMessage(response);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == OtFailureType::DecryptionFailed);
        REQUIRE(receiver->GetPhase() == ReceiverPhase::Aborted);
        REQUIRE(receiver->RetainedPrivateKeyCount() == 0);
    }
    SECTION("Ciphertext made for a foreign key fails") {
        auto other = std::make_shared<MockAsymmetricCipher>();
        auto unrelated = other->GenerateKeyPair(0).Unwrap();
        auto ciphertext = other->Encrypt(unrelated.GetPublicKey(), Bytes("x")).Unwrap();
        SenderResponse response(ciphertext, ciphertext);
        REQUIRE(receiver->DecryptMessage(response).IsErr());
        REQUIRE(receiver->GetPhase() == ReceiverPhase::Aborted);
    }
}

TEST_CASE("State transitions - Sender", "[boundaries][state][sender]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto cipher = std::make_shared<MockAsymmetricCipher>();
    auto receiver = CreateReceiver(Choice::Zero, cipher);
    auto offer = receiver->GeneratePublicKeys().Unwrap();

    SECTION("Encrypting twice is a state error") {
        auto sender = CreateSender(cipher);
        REQUIRE(sender->EncryptMessages(offer).IsOk());
        auto again = sender->EncryptMessages(offer);
        REQUIRE(again.IsErrAnd(IsStateError));
        REQUIRE(again.UnwrapErr().message == std::string(ErrorMessages::MESSAGES_ALREADY_ENCRYPTED));
        REQUIRE(sender->GetPhase() == SenderPhase::Aborted);
    }
    SECTION("Aborted sender stays aborted") {
        auto sender = CreateSender(cipher);
        cipher->SetMaxPlaintext(1);
        REQUIRE(sender->EncryptMessages(offer).IsErr());
        REQUIRE(sender->GetPhase() == SenderPhase::Aborted);
        auto again = sender->EncryptMessages(offer);
        REQUIRE(again.IsErrAnd(IsStateError));
        REQUIRE(again.UnwrapErr().message == std::string(ErrorMessages::SESSION_ABORTED));
    }
    SECTION("Phase names") {
        REQUIRE(std::string(ToString(SenderPhase::Encrypted)) == "ENCRYPTED");
        REQUIRE(std::string(ToString(ReceiverPhase::KeysGenerated)) == "KEYS_GENERATED");
        REQUIRE(std::string(ToString(ReceiverPhase::ResponseReceived)) == "RESPONSE_RECEIVED");
    }
}
