#pragma once

#include "otkit/core/result.hpp"
#include "otkit/core/failures.hpp"
#include "otkit/models/bundles/receiver_public_keys.hpp"
#include "otkit/models/bundles/sender_response.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace otkit::protocol::serialization {
using models::ReceiverPublicKeys;
using models::SenderResponse;

/**
 * @brief Wire encoding of the two transfer messages
 *
 * Protobuf (otkit.proto.transfer), serialised deterministically. Decoding
 * rejects oversized input, unknown versions, unknown suites and empty slots
 * with OtFailureType::Decode; encoding rejects offers whose slots disagree on
 * the suite with OtFailureType::Encode.
 */
class TransferCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, OtFailure> EncodeOffer(const ReceiverPublicKeys& offer);

    [[nodiscard]] static Result<ReceiverPublicKeys, OtFailure> DecodeOffer(std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<std::vector<uint8_t>, OtFailure> EncodeResponse(const SenderResponse& response);

    [[nodiscard]] static Result<SenderResponse, OtFailure> DecodeResponse(std::span<const uint8_t> bytes);

private:
    TransferCodec() = delete;
};

} // namespace otkit::protocol::serialization
