#include "otkit/protocol/transfer/ot_sender.hpp"
#include "otkit/crypto/asymmetric_cipher_factory.hpp"
#include "otkit/crypto/sodium_interop.hpp"
#include "otkit/core/constants.hpp"
#include "otkit/core/format.hpp"
#include "otkit/debug/key_logger.hpp"

namespace otkit::protocol::transfer {
using crypto::SodiumInterop;
using debug::Side;

ObliviousTransferSender::ObliviousTransferSender(
    std::vector<uint8_t> message0,
    std::vector<uint8_t> message1,
    OtConfig config,
    std::shared_ptr<IAsymmetricCipher> cipher)
    : lock_(std::make_unique<std::mutex>())
      , config_(config)
      , cipher_(std::move(cipher))
      , state_(Ready{{std::move(message0), std::move(message1)}}) {
}

ObliviousTransferSender::~ObliviousTransferSender() {
    if (auto* ready = std::get_if<Ready>(&state_)) {
        WipeMessages(*ready);
    }
}

Result<std::unique_ptr<ObliviousTransferSender>, OtFailure>
ObliviousTransferSender::Create(
    std::vector<uint8_t> message0,
    std::vector<uint8_t> message1,
    const OtConfig& config) {
    auto cipher_result = crypto::CreateAsymmetricCipher(config.GetSuite());
    if (cipher_result.IsErr()) {
        SodiumInterop::SecureWipe(std::span(message0));
        SodiumInterop::SecureWipe(std::span(message1));
        return Result<std::unique_ptr<ObliviousTransferSender>, OtFailure>::Err(
            OtFailure::InvalidInput(cipher_result.UnwrapErr().message));
    }
    return Create(std::move(message0), std::move(message1), config, std::move(cipher_result).Unwrap());
}

Result<std::unique_ptr<ObliviousTransferSender>, OtFailure>
ObliviousTransferSender::Create(
    std::vector<uint8_t> message0,
    std::vector<uint8_t> message1,
    const OtConfig& config,
    std::shared_ptr<IAsymmetricCipher> cipher) {
    using CreateResult = Result<std::unique_ptr<ObliviousTransferSender>, OtFailure>;

    auto reject = [&](OtFailure failure) {
        SodiumInterop::SecureWipe(std::span(message0));
        SodiumInterop::SecureWipe(std::span(message1));
        return CreateResult::Err(std::move(failure));
    };

    if (!cipher) {
        return reject(OtFailure::InvalidInput("Cipher backend must not be null"));
    }
    if (cipher->GetSuite() != config.GetSuite()) {
        return reject(OtFailure::InvalidInput(
            compat::format("Cipher backend {} does not match configured suite {}",
                enums::ToString(cipher->GetSuite()), enums::ToString(config.GetSuite()))));
    }
    if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
        return reject(OtFailure::InvalidInput(init_result.UnwrapErr().message));
    }

    return CreateResult::Ok(
        std::unique_ptr<ObliviousTransferSender>(
            new ObliviousTransferSender(std::move(message0), std::move(message1), config, std::move(cipher))));
}

SenderPhase ObliviousTransferSender::PhaseOf(const State& state) noexcept {
    if (std::holds_alternative<Ready>(state)) {
        return SenderPhase::Init;
    }
    if (std::holds_alternative<Encrypted>(state)) {
        return SenderPhase::Encrypted;
    }
    return SenderPhase::Aborted;
}

void ObliviousTransferSender::WipeMessages(Ready& ready) {
    for (auto& message : ready.messages) {
        SodiumInterop::SecureWipe(std::span(message));
        message.clear();
    }
}

void ObliviousTransferSender::TransitionTo(State next) {
    const SenderPhase from = PhaseOf(state_);
    if (auto* ready = std::get_if<Ready>(&state_)) {
        WipeMessages(*ready);
    }
    state_ = std::move(next);
    debug::LogPhaseChange(Side::Sender, ToString(from), ToString(PhaseOf(state_)));
}

OtFailure ObliviousTransferSender::Abort(OtFailure failure) {
    debug::LogFailure(Side::Sender, ToString(failure.type).data(), failure.message);
    if (!std::holds_alternative<Aborted>(state_)) {
        TransitionTo(Aborted{});
    }
    return failure;
}

Result<SenderResponse, OtFailure> ObliviousTransferSender::EncryptMessages(
    const ReceiverPublicKeys& public_keys) {
    std::lock_guard lock(*lock_);

    auto* ready = std::get_if<Ready>(&state_);
    if (ready == nullptr) {
        const auto message = std::holds_alternative<Aborted>(state_)
            ? std::string(ErrorMessages::SESSION_ABORTED)
            : std::string(ErrorMessages::MESSAGES_ALREADY_ENCRYPTED);
        return Result<SenderResponse, OtFailure>::Err(
            Abort(OtFailure::ProtocolStateError(message)));
    }

    OT_LOG_SECTION(Side::Sender, "ENCRYPT MESSAGES");
    debug::LogPublicKeyOffer(
        Side::Sender, enums::ToString(public_keys.Slot0().GetSuite()),
        public_keys.Slot0().GetBytes(), public_keys.Slot1().GetBytes());

    auto ciphertext0 = cipher_->Encrypt(public_keys.Slot0(), ready->messages[TransferConstants::SLOT_ZERO]);
    auto ciphertext1 = cipher_->Encrypt(public_keys.Slot1(), ready->messages[TransferConstants::SLOT_ONE]);

    if (ciphertext0.IsErr()) {
        return Result<SenderResponse, OtFailure>::Err(
            Abort(OtFailure::EncryptionFailed(
                TransferConstants::SLOT_ZERO,
                compat::format("Slot 0: {}", ciphertext0.UnwrapErr().message))));
    }
    if (ciphertext1.IsErr()) {
        return Result<SenderResponse, OtFailure>::Err(
            Abort(OtFailure::EncryptionFailed(
                TransferConstants::SLOT_ONE,
                compat::format("Slot 1: {}", ciphertext1.UnwrapErr().message))));
    }

    SenderResponse response(std::move(ciphertext0).Unwrap(), std::move(ciphertext1).Unwrap());
    debug::LogSenderResponse(Side::Sender, response.Ciphertext0().size(), response.Ciphertext1().size());

    TransitionTo(Encrypted{});
    return Result<SenderResponse, OtFailure>::Ok(std::move(response));
}

SenderPhase ObliviousTransferSender::GetPhase() const {
    std::lock_guard lock(*lock_);
    return PhaseOf(state_);
}

} // namespace otkit::protocol::transfer
