#include "otkit/protocol/transfer/ot_receiver.hpp"
#include "otkit/crypto/asymmetric_cipher_factory.hpp"
#include "otkit/crypto/sodium_interop.hpp"
#include "otkit/core/constants.hpp"
#include "otkit/core/format.hpp"
#include "otkit/debug/key_logger.hpp"

namespace otkit::protocol::transfer {
using crypto::SodiumInterop;
using debug::Side;

namespace {
    constexpr size_t PROBE_SIZE = 16;
}

ObliviousTransferReceiver::ObliviousTransferReceiver(
    const Choice choice,
    OtConfig config,
    std::shared_ptr<IAsymmetricCipher> cipher)
    : lock_(std::make_unique<std::mutex>())
      , choice_(choice)
      , config_(config)
      , cipher_(std::move(cipher))
      , state_(AwaitingKeys{}) {
}

ObliviousTransferReceiver::~ObliviousTransferReceiver() = default;

Result<std::unique_ptr<ObliviousTransferReceiver>, OtFailure>
ObliviousTransferReceiver::Create(const Choice choice, const OtConfig& config) {
    auto cipher_result = crypto::CreateAsymmetricCipher(config.GetSuite());
    if (cipher_result.IsErr()) {
        return Result<std::unique_ptr<ObliviousTransferReceiver>, OtFailure>::Err(
            OtFailure::InvalidInput(cipher_result.UnwrapErr().message));
    }
    return Create(choice, config, std::move(cipher_result).Unwrap());
}

Result<std::unique_ptr<ObliviousTransferReceiver>, OtFailure>
ObliviousTransferReceiver::Create(
    const Choice choice,
    const OtConfig& config,
    std::shared_ptr<IAsymmetricCipher> cipher) {
    using CreateResult = Result<std::unique_ptr<ObliviousTransferReceiver>, OtFailure>;

    if (choice != Choice::Zero && choice != Choice::One) {
        return CreateResult::Err(
            OtFailure::InvalidChoice(
                compat::format("Invalid choice value: {}", static_cast<unsigned>(choice))));
    }
    if (!cipher) {
        return CreateResult::Err(OtFailure::InvalidInput("Cipher backend must not be null"));
    }
    if (cipher->GetSuite() != config.GetSuite()) {
        return CreateResult::Err(
            OtFailure::InvalidInput(
                compat::format("Cipher backend {} does not match configured suite {}",
                    enums::ToString(cipher->GetSuite()), enums::ToString(config.GetSuite()))));
    }
    if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
        return CreateResult::Err(OtFailure::InvalidInput(init_result.UnwrapErr().message));
    }

    return CreateResult::Ok(
        std::unique_ptr<ObliviousTransferReceiver>(
            new ObliviousTransferReceiver(choice, config, std::move(cipher))));
}

Result<std::unique_ptr<ObliviousTransferReceiver>, OtFailure>
ObliviousTransferReceiver::CreateFromBit(const uint64_t choice_bit, const OtConfig& config) {
    auto choice_result = enums::ChoiceFromBit(choice_bit);
    if (choice_result.IsErr()) {
        return Result<std::unique_ptr<ObliviousTransferReceiver>, OtFailure>::Err(
            choice_result.UnwrapErr());
    }
    return Create(choice_result.Unwrap(), config);
}

ReceiverPhase ObliviousTransferReceiver::PhaseOf(const State& state) const noexcept {
    if (std::holds_alternative<AwaitingKeys>(state)) {
        return ReceiverPhase::Init;
    }
    if (std::holds_alternative<KeysGenerated>(state)) {
        return ReceiverPhase::KeysGenerated;
    }
    if (std::holds_alternative<ResponseReceived>(state)) {
        return ReceiverPhase::ResponseReceived;
    }
    if (std::holds_alternative<Decrypted>(state)) {
        return ReceiverPhase::Decrypted;
    }
    return ReceiverPhase::Aborted;
}

void ObliviousTransferReceiver::TransitionTo(State next) {
    const ReceiverPhase from = PhaseOf(state_);
    state_ = std::move(next);
    debug::LogPhaseChange(Side::Receiver, ToString(from), ToString(PhaseOf(state_)));
}

OtFailure ObliviousTransferReceiver::Abort(OtFailure failure) {
    debug::LogFailure(Side::Receiver, ToString(failure.type).data(), failure.message);
    if (!std::holds_alternative<Aborted>(state_)) {
        TransitionTo(Aborted{});
    }
    return failure;
}

Result<PublicKey, CipherFailure> ObliviousTransferReceiver::GenerateDecoyPublicKey() const {
    auto decoy_result = cipher_->GenerateKeyPair(config_.GetKeyBits());
    if (decoy_result.IsErr()) {
        return Result<PublicKey, CipherFailure>::Err(decoy_result.UnwrapErr());
    }
    // The decoy private key is destroyed here and never leaves this scope
    return Result<PublicKey, CipherFailure>::Ok(
        std::move(decoy_result).Unwrap().DiscardPrivateKey());
}

Result<ReceiverPublicKeys, OtFailure> ObliviousTransferReceiver::GeneratePublicKeys() {
    std::lock_guard lock(*lock_);

    if (!std::holds_alternative<AwaitingKeys>(state_)) {
        const auto message = std::holds_alternative<Aborted>(state_)
            ? std::string(ErrorMessages::SESSION_ABORTED)
            : std::string(ErrorMessages::KEYS_ALREADY_GENERATED);
        return Result<ReceiverPublicKeys, OtFailure>::Err(
            Abort(OtFailure::ProtocolStateError(message)));
    }

    OT_LOG_SECTION(Side::Receiver, "GENERATE PUBLIC KEYS");

    auto real_result = cipher_->GenerateKeyPair(config_.GetKeyBits());
    if (real_result.IsErr()) {
        return Result<ReceiverPublicKeys, OtFailure>::Err(
            Abort(OtFailure::KeyGenerationFailed(
                compat::format("Real key pair: {}", real_result.UnwrapErr().message))));
    }
    auto real_pair = std::move(real_result).Unwrap();

    auto decoy_result = GenerateDecoyPublicKey();
    if (decoy_result.IsErr()) {
        // real_pair is wiped when it goes out of scope
        return Result<ReceiverPublicKeys, OtFailure>::Err(
            Abort(OtFailure::KeyGenerationFailed(
                compat::format("Decoy key pair: {}", decoy_result.UnwrapErr().message))));
    }
    PublicKey decoy_public = std::move(decoy_result).Unwrap();

    PublicKey real_public = real_pair.GetPublicKey();
    PrivateKey real_private = std::move(real_pair).TakePrivateKey();

    ReceiverPublicKeys offer = choice_ == Choice::Zero
        ? ReceiverPublicKeys(std::move(real_public), std::move(decoy_public))
        : ReceiverPublicKeys(std::move(decoy_public), std::move(real_public));

    debug::LogPublicKeyOffer(
        Side::Receiver, enums::ToString(config_.GetSuite()),
        offer.Slot0().GetBytes(), offer.Slot1().GetBytes());

    TransitionTo(KeysGenerated{std::move(real_private)});
    return Result<ReceiverPublicKeys, OtFailure>::Ok(std::move(offer));
}

Result<std::vector<uint8_t>, OtFailure> ObliviousTransferReceiver::DecryptMessage(
    const SenderResponse& response) {
    std::lock_guard lock(*lock_);

    if (!std::holds_alternative<KeysGenerated>(state_)) {
        std::string message;
        if (std::holds_alternative<AwaitingKeys>(state_)) {
            message = std::string(ErrorMessages::KEYS_NOT_GENERATED);
        } else if (std::holds_alternative<Aborted>(state_)) {
            message = std::string(ErrorMessages::SESSION_ABORTED);
        } else {
            message = std::string(ErrorMessages::SESSION_COMPLETED);
        }
        return Result<std::vector<uint8_t>, OtFailure>::Err(
            Abort(OtFailure::ProtocolStateError(message)));
    }

    PrivateKey private_key = std::move(std::get<KeysGenerated>(state_).private_key);
    TransitionTo(ResponseReceived{});

    OT_LOG_VALUE(Side::Receiver, "DECRYPT", "ciphertext_size", response.At(choice_).size());
    auto decrypt_result = cipher_->Decrypt(private_key, response.At(choice_));
    private_key.Destroy();

    if (decrypt_result.IsErr()) {
        return Result<std::vector<uint8_t>, OtFailure>::Err(
            Abort(OtFailure::DecryptionFailed(decrypt_result.UnwrapErr().message)));
    }

    TransitionTo(Decrypted{});
    return Result<std::vector<uint8_t>, OtFailure>::Ok(std::move(decrypt_result).Unwrap());
}

Result<bool, OtFailure> ObliviousTransferReceiver::CanDecryptFor(const PublicKey& public_key) const {
    std::lock_guard lock(*lock_);

    const auto* generated = std::get_if<KeysGenerated>(&state_);
    if (generated == nullptr) {
        return Result<bool, OtFailure>::Err(
            OtFailure::ProtocolStateError(std::string(ErrorMessages::KEYS_NOT_GENERATED)));
    }

    auto probe = SodiumInterop::GetRandomBytes(PROBE_SIZE);
    auto encrypt_result = cipher_->Encrypt(public_key, probe);
    if (encrypt_result.IsErr()) {
        return Result<bool, OtFailure>::Err(
            OtFailure::InvalidInput(
                compat::format("Cannot probe public key: {}", encrypt_result.UnwrapErr().message)));
    }

    auto decrypt_result = cipher_->Decrypt(generated->private_key, encrypt_result.Unwrap());
    if (decrypt_result.IsErr()) {
        return Result<bool, OtFailure>::Ok(false);
    }

    auto recovered = std::move(decrypt_result).Unwrap();
    auto equal_result = SodiumInterop::ConstantTimeEquals(probe, recovered);
    SodiumInterop::SecureWipe(std::span(recovered));
    if (equal_result.IsErr()) {
        return Result<bool, OtFailure>::Err(OtFailure::InvalidInput(equal_result.UnwrapErr().message));
    }
    return Result<bool, OtFailure>::Ok(equal_result.Unwrap());
}

ReceiverPhase ObliviousTransferReceiver::GetPhase() const {
    std::lock_guard lock(*lock_);
    return PhaseOf(state_);
}

size_t ObliviousTransferReceiver::RetainedPrivateKeyCount() const {
    std::lock_guard lock(*lock_);
    const auto* generated = std::get_if<KeysGenerated>(&state_);
    return generated != nullptr && !generated->private_key.IsDestroyed() ? 1 : 0;
}

} // namespace otkit::protocol::transfer
