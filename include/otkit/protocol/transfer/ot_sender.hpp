#pragma once
#include "otkit/core/result.hpp"
#include "otkit/core/failures.hpp"
#include "otkit/configuration/ot_config.hpp"
#include "otkit/interfaces/i_asymmetric_cipher.hpp"
#include "otkit/models/bundles/receiver_public_keys.hpp"
#include "otkit/models/bundles/sender_response.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <variant>
#include <vector>

namespace otkit::protocol::transfer {
using configuration::OtConfig;
using interfaces::IAsymmetricCipher;
using models::PublicKey;
using models::ReceiverPublicKeys;
using models::SenderResponse;

enum class SenderPhase : uint8_t {
    Init,
    Encrypted,
    Aborted
};

constexpr const char* ToString(const SenderPhase phase) noexcept {
    switch (phase) {
        case SenderPhase::Init: return "INIT";
        case SenderPhase::Encrypted: return "ENCRYPTED";
        case SenderPhase::Aborted: return "ABORTED";
    }
    return "UNKNOWN";
}

/**
 * Sender side of a 1-out-of-2 oblivious transfer.
 *
 * Holds two messages fixed at construction and encrypts message i under the
 * public key in slot i of the receiver's offer. Both encryptions always run,
 * so the sender's work does not depend on which slot is real. The messages
 * are wiped once EncryptMessages returns, whatever the outcome.
 */
class ObliviousTransferSender {
public:
    [[nodiscard]] static Result<std::unique_ptr<ObliviousTransferSender>, OtFailure> Create(
        std::vector<uint8_t> message0,
        std::vector<uint8_t> message1,
        const OtConfig& config);

    [[nodiscard]] static Result<std::unique_ptr<ObliviousTransferSender>, OtFailure> Create(
        std::vector<uint8_t> message0,
        std::vector<uint8_t> message1,
        const OtConfig& config,
        std::shared_ptr<IAsymmetricCipher> cipher);

    ~ObliviousTransferSender();

    ObliviousTransferSender(const ObliviousTransferSender&) = delete;
    ObliviousTransferSender& operator=(const ObliviousTransferSender&) = delete;
    ObliviousTransferSender(ObliviousTransferSender&&) = delete;
    ObliviousTransferSender& operator=(ObliviousTransferSender&&) = delete;

    /**
     * @return ciphertext_i = Encrypt(slot_i, message_i), or EncryptionFailed
     *         naming the lowest failing slot. No partial response is returned.
     */
    [[nodiscard]] Result<SenderResponse, OtFailure> EncryptMessages(const ReceiverPublicKeys& public_keys);

    [[nodiscard]] SenderPhase GetPhase() const;

    [[nodiscard]] const OtConfig& GetConfig() const noexcept {
        return config_;
    }

private:
    struct Ready {
        std::array<std::vector<uint8_t>, 2> messages;
    };
    struct Encrypted {};
    struct Aborted {};
    using State = std::variant<Ready, Encrypted, Aborted>;

    ObliviousTransferSender(
        std::vector<uint8_t> message0,
        std::vector<uint8_t> message1,
        OtConfig config,
        std::shared_ptr<IAsymmetricCipher> cipher);

    [[nodiscard]] static SenderPhase PhaseOf(const State& state) noexcept;

    void TransitionTo(State next);

    OtFailure Abort(OtFailure failure);

    static void WipeMessages(Ready& ready);

    std::unique_ptr<std::mutex> lock_;
    const OtConfig config_;
    std::shared_ptr<IAsymmetricCipher> cipher_;
    State state_;
};

} // namespace otkit::protocol::transfer
