#include <catch2/catch_test_macros.hpp>
#include "otkit/protocol/transfer/ot_receiver.hpp"
#include "otkit/crypto/sodium_interop.hpp"
#include "../helpers/mock_asymmetric_cipher.hpp"
using namespace otkit::protocol;
using namespace otkit::protocol::transfer;
using namespace otkit::protocol::test_helpers;
using otkit::protocol::enums::Choice;

namespace {

auto CreateReceiver(const Choice choice, std::shared_ptr<MockAsymmetricCipher> cipher) {
    auto result = ObliviousTransferReceiver::Create(choice, OtConfig::Reference(), std::move(cipher));
    REQUIRE(result.IsOk());
    return std::move(result).Unwrap();
}

}

TEST_CASE("Key arrangement - Real key goes to the chosen slot", "[receiver][keys]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Choice Zero: slot 0 real, slot 1 decoy") {
        auto cipher = std::make_shared<MockAsymmetricCipher>();
        auto receiver = CreateReceiver(Choice::Zero, cipher);
        auto offer = receiver->GeneratePublicKeys();
        REQUIRE(offer.IsOk());

        const auto issued = cipher->IssuedPublicKeys();
        REQUIRE(issued.size() == 2);
        REQUIRE(offer.Unwrap().Slot0() == issued[0]);
        REQUIRE(offer.Unwrap().Slot1() == issued[1]);
        REQUIRE(receiver->CanDecryptFor(offer.Unwrap().Slot0()).Unwrap());
        REQUIRE_FALSE(receiver->CanDecryptFor(offer.Unwrap().Slot1()).Unwrap());
    }
    SECTION("Choice One: slot 0 decoy, slot 1 real") {
        auto cipher = std::make_shared<MockAsymmetricCipher>();
        auto receiver = CreateReceiver(Choice::One, cipher);
        auto offer = receiver->GeneratePublicKeys();
        REQUIRE(offer.IsOk());

        const auto issued = cipher->IssuedPublicKeys();
        REQUIRE(issued.size() == 2);
        REQUIRE(offer.Unwrap().Slot1() == issued[0]);
        REQUIRE(offer.Unwrap().Slot0() == issued[1]);
        REQUIRE_FALSE(receiver->CanDecryptFor(offer.Unwrap().Slot0()).Unwrap());
        REQUIRE(receiver->CanDecryptFor(offer.Unwrap().Slot1()).Unwrap());
    }
    SECTION("Both slots are distinct keys of the configured suite") {
        auto cipher = std::make_shared<MockAsymmetricCipher>();
        auto receiver = CreateReceiver(Choice::One, cipher);
        auto offer = receiver->GeneratePublicKeys().Unwrap();
        REQUIRE(offer.Slot0() != offer.Slot1());
        REQUIRE(offer.Slot0().GetSuite() == CipherSuite::RsaOaepSha256);
        REQUIRE(offer.Slot1().GetSuite() == CipherSuite::RsaOaepSha256);
        REQUIRE(offer.At(Choice::One) == offer.Slot1());
    }
    SECTION("Probing does not change the session") {
        auto cipher = std::make_shared<MockAsymmetricCipher>();
        auto receiver = CreateReceiver(Choice::Zero, cipher);
        auto offer = receiver->GeneratePublicKeys().Unwrap();
        REQUIRE(receiver->CanDecryptFor(offer.Slot1()).IsOk());
        REQUIRE(receiver->GetPhase() == ReceiverPhase::KeysGenerated);
        REQUIRE(receiver->RetainedPrivateKeyCount() == 1);
    }
}

TEST_CASE("Key arrangement - Key generation failures", "[receiver][keys][errors]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Real key pair failure aborts") {
        auto cipher = std::make_shared<MockAsymmetricCipher>();
        cipher->FailKeyGenerationOnCall(1);
        auto receiver = CreateReceiver(Choice::Zero, cipher);
        auto offer = receiver->GeneratePublicKeys();
        REQUIRE(offer.IsErr());
        REQUIRE(offer.UnwrapErr().type == OtFailureType::KeyGenerationFailed);
        REQUIRE(receiver->GetPhase() == ReceiverPhase::Aborted);
        REQUIRE(receiver->RetainedPrivateKeyCount() == 0);
    }
    SECTION("Decoy key pair failure aborts and keeps nothing") {
        auto cipher = std::make_shared<MockAsymmetricCipher>();
        cipher->FailKeyGenerationOnCall(2);
        auto receiver = CreateReceiver(Choice::One, cipher);
        auto offer = receiver->GeneratePublicKeys();
        REQUIRE(offer.IsErr());
        REQUIRE(offer.UnwrapErr().type == OtFailureType::KeyGenerationFailed);
        REQUIRE(receiver->GetPhase() == ReceiverPhase::Aborted);
        REQUIRE(receiver->RetainedPrivateKeyCount() == 0);
    }
}

TEST_CASE("Key arrangement - Session construction", "[receiver][validation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Choice bit outside {0, 1} is rejected") {
        auto receiver = ObliviousTransferReceiver::CreateFromBit(2, OtConfig::Reference());
        REQUIRE(receiver.IsErr());
        REQUIRE(receiver.UnwrapErr().type == OtFailureType::InvalidChoice);
    }
    SECTION("Choice bit 1 selects One") {
        auto receiver = ObliviousTransferReceiver::CreateFromBit(1, OtConfig::Reference());
        REQUIRE(receiver.IsOk());
        REQUIRE(receiver.Unwrap()->GetChoice() == Choice::One);
        REQUIRE(receiver.Unwrap()->GetPhase() == ReceiverPhase::Init);
    }
    SECTION("Null cipher is rejected") {
        auto receiver = ObliviousTransferReceiver::Create(Choice::Zero, OtConfig::Reference(), nullptr);
        REQUIRE(receiver.IsErr());
        REQUIRE(receiver.UnwrapErr().type == OtFailureType::InvalidInput);
    }
    SECTION("Cipher of another suite is rejected") {
        auto receiver = ObliviousTransferReceiver::Create(
            Choice::Zero, OtConfig::PostQuantum(), std::make_shared<MockAsymmetricCipher>(CipherSuite::RsaOaepSha256));
        REQUIRE(receiver.IsErr());
        REQUIRE(receiver.UnwrapErr().type == OtFailureType::InvalidInput);
    }
}
