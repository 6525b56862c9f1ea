#pragma once
#include "otkit/core/result.hpp"
#include "otkit/core/failures.hpp"
#include "otkit/configuration/ot_config.hpp"
#include "otkit/enums/choice.hpp"
#include "otkit/interfaces/i_asymmetric_cipher.hpp"
#include "otkit/models/bundles/receiver_public_keys.hpp"
#include "otkit/models/bundles/sender_response.hpp"
#include "otkit/models/keys/private_key.hpp"
#include "otkit/models/keys/public_key.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <variant>
#include <vector>

namespace otkit::protocol::transfer {
using configuration::OtConfig;
using enums::Choice;
using interfaces::IAsymmetricCipher;
using models::PrivateKey;
using models::PublicKey;
using models::ReceiverPublicKeys;
using models::SenderResponse;

enum class ReceiverPhase : uint8_t {
    Init,
    KeysGenerated,
    /// Only observable from inside DecryptMessage.
    ResponseReceived,
    Decrypted,
    Aborted
};

constexpr const char* ToString(const ReceiverPhase phase) noexcept {
    switch (phase) {
        case ReceiverPhase::Init: return "INIT";
        case ReceiverPhase::KeysGenerated: return "KEYS_GENERATED";
        case ReceiverPhase::ResponseReceived: return "RESPONSE_RECEIVED";
        case ReceiverPhase::Decrypted: return "DECRYPTED";
        case ReceiverPhase::Aborted: return "ABORTED";
    }
    return "UNKNOWN";
}

/**
 * Receiver side of a 1-out-of-2 oblivious transfer.
 *
 * One object runs exactly one transfer:
 *
 *   auto receiver = ObliviousTransferReceiver::Create(Choice::One, OtConfig::Default()).Unwrap();
 *   auto offer = receiver->GeneratePublicKeys().Unwrap();     // send to sender
 *   auto message = receiver->DecryptMessage(response).Unwrap();
 *
 * GeneratePublicKeys creates a real key pair and a decoy pair, destroys the
 * decoy private key before returning, and places the real public key in slot
 * ChoiceToBit(choice). The only private key the session ever holds is the real
 * one; it is wiped as soon as the session leaves KeysGenerated.
 *
 * Every failure returned by GeneratePublicKeys or DecryptMessage aborts the
 * session. Operations are serialised by an internal mutex.
 */
class ObliviousTransferReceiver {
public:
    [[nodiscard]] static Result<std::unique_ptr<ObliviousTransferReceiver>, OtFailure> Create(
        Choice choice,
        const OtConfig& config);

    /// Runs the session over an explicit backend; cipher must match config's suite.
    [[nodiscard]] static Result<std::unique_ptr<ObliviousTransferReceiver>, OtFailure> Create(
        Choice choice,
        const OtConfig& config,
        std::shared_ptr<IAsymmetricCipher> cipher);

    /// Validates an externally supplied choice bit first (InvalidChoice unless 0 or 1).
    [[nodiscard]] static Result<std::unique_ptr<ObliviousTransferReceiver>, OtFailure> CreateFromBit(
        uint64_t choice_bit,
        const OtConfig& config);

    ~ObliviousTransferReceiver();

    ObliviousTransferReceiver(const ObliviousTransferReceiver&) = delete;
    ObliviousTransferReceiver& operator=(const ObliviousTransferReceiver&) = delete;
    ObliviousTransferReceiver(ObliviousTransferReceiver&&) = delete;
    ObliviousTransferReceiver& operator=(ObliviousTransferReceiver&&) = delete;

    [[nodiscard]] Result<ReceiverPublicKeys, OtFailure> GeneratePublicKeys();

    /// Decrypts the ciphertext at the chosen slot; the other one is never read.
    [[nodiscard]] Result<std::vector<uint8_t>, OtFailure> DecryptMessage(const SenderResponse& response);

    /**
     * Whether the retained private key opens ciphertexts made for public_key.
     *
     * Encrypts a random probe under public_key and tries to decrypt it. Only
     * valid in KeysGenerated; a failed query does not abort the session.
     */
    [[nodiscard]] Result<bool, OtFailure> CanDecryptFor(const PublicKey& public_key) const;

    [[nodiscard]] ReceiverPhase GetPhase() const;

    [[nodiscard]] Choice GetChoice() const noexcept {
        return choice_;
    }

    [[nodiscard]] const OtConfig& GetConfig() const noexcept {
        return config_;
    }

    /// Number of live private keys owned by this session (0 or 1).
    [[nodiscard]] size_t RetainedPrivateKeyCount() const;

private:
    struct AwaitingKeys {};
    struct KeysGenerated {
        PrivateKey private_key;
    };
    struct ResponseReceived {};
    struct Decrypted {};
    struct Aborted {};
    using State = std::variant<AwaitingKeys, KeysGenerated, ResponseReceived, Decrypted, Aborted>;

    ObliviousTransferReceiver(Choice choice, OtConfig config, std::shared_ptr<IAsymmetricCipher> cipher);

    [[nodiscard]] Result<PublicKey, CipherFailure> GenerateDecoyPublicKey() const;

    [[nodiscard]] ReceiverPhase PhaseOf(const State& state) const noexcept;

    void TransitionTo(State next);

    OtFailure Abort(OtFailure failure);

    std::unique_ptr<std::mutex> lock_;
    const Choice choice_;
    const OtConfig config_;
    std::shared_ptr<IAsymmetricCipher> cipher_;
    State state_;
};

} // namespace otkit::protocol::transfer
