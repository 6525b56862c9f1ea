#include "otkit/serialization/transfer_codec.hpp"
#include "otkit/core/constants.hpp"
#include "otkit/core/format.hpp"

#include "otkit/transfer.pb.h"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/message_lite.h>
#include <string>

namespace otkit::protocol::serialization {
using enums::CipherSuite;
using models::PublicKey;

namespace {
    namespace wire = ::otkit::proto::transfer;

    Result<std::vector<uint8_t>, OtFailure> SerializeDeterministic(
        const google::protobuf::MessageLite& message) {
        std::string output;
        {
            google::protobuf::io::StringOutputStream stream(&output);
            google::protobuf::io::CodedOutputStream coded_out(&stream);
            coded_out.SetSerializationDeterministic(true);
            if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
                return Result<std::vector<uint8_t>, OtFailure>::Err(
                    OtFailure::Encode("Failed to serialize protobuf deterministically"));
            }
        }
        return Result<std::vector<uint8_t>, OtFailure>::Ok(
            std::vector<uint8_t>(output.begin(), output.end()));
    }

    Result<Unit, OtFailure> CheckInputSize(std::span<const uint8_t> bytes, const char* what) {
        if (bytes.empty()) {
            return Result<Unit, OtFailure>::Err(
                OtFailure::Decode(compat::format("{} is empty", what)));
        }
        if (bytes.size() > TransferConstants::MAX_WIRE_MESSAGE_SIZE) {
            return Result<Unit, OtFailure>::Err(
                OtFailure::Decode(
                    compat::format("{} of {} bytes exceeds limit of {} bytes",
                        what, bytes.size(), TransferConstants::MAX_WIRE_MESSAGE_SIZE)));
        }
        return Result<Unit, OtFailure>::Ok(unit);
    }

    Result<Unit, OtFailure> CheckVersion(const uint32_t version, const char* what) {
        if (version != TransferConstants::WIRE_VERSION) {
            return Result<Unit, OtFailure>::Err(
                OtFailure::Decode(
                    compat::format("Unsupported {} version {} (expected {})",
                        what, version, TransferConstants::WIRE_VERSION)));
        }
        return Result<Unit, OtFailure>::Ok(unit);
    }

    wire::CipherSuite ToWire(const CipherSuite suite) {
        switch (suite) {
            case CipherSuite::RsaOaepSha256:
                return wire::CIPHER_SUITE_RSA_OAEP_SHA256;
            case CipherSuite::Kyber768AesGcm:
                return wire::CIPHER_SUITE_KYBER768_AES256_GCM;
        }
        return wire::CIPHER_SUITE_UNSPECIFIED;
    }

    Result<CipherSuite, OtFailure> FromWire(const int suite) {
        switch (suite) {
            case wire::CIPHER_SUITE_RSA_OAEP_SHA256:
                return Result<CipherSuite, OtFailure>::Ok(CipherSuite::RsaOaepSha256);
            case wire::CIPHER_SUITE_KYBER768_AES256_GCM:
                return Result<CipherSuite, OtFailure>::Ok(CipherSuite::Kyber768AesGcm);
            default:
                return Result<CipherSuite, OtFailure>::Err(
                    OtFailure::Decode(compat::format("Unknown cipher suite tag {}", suite)));
        }
    }
}

Result<std::vector<uint8_t>, OtFailure> TransferCodec::EncodeOffer(const ReceiverPublicKeys& offer) {
    const auto& slot0 = offer.Slot0();
    const auto& slot1 = offer.Slot1();
    if (slot0.IsEmpty() || slot1.IsEmpty()) {
        return Result<std::vector<uint8_t>, OtFailure>::Err(
            OtFailure::Encode("Public key offer has an empty slot"));
    }
    if (slot0.GetSuite() != slot1.GetSuite()) {
        return Result<std::vector<uint8_t>, OtFailure>::Err(
            OtFailure::Encode(
                compat::format("Public key offer mixes suites {} and {}",
                    enums::ToString(slot0.GetSuite()), enums::ToString(slot1.GetSuite()))));
    }

    wire::PublicKeyOffer proto;
    proto.set_version(TransferConstants::WIRE_VERSION);
    proto.set_suite(ToWire(slot0.GetSuite()));
    proto.set_slot0(slot0.GetBytes().data(), slot0.Size());
    proto.set_slot1(slot1.GetBytes().data(), slot1.Size());
    return SerializeDeterministic(proto);
}

Result<ReceiverPublicKeys, OtFailure> TransferCodec::DecodeOffer(std::span<const uint8_t> bytes) {
    if (auto size_check = CheckInputSize(bytes, "Public key offer"); size_check.IsErr()) {
        return Result<ReceiverPublicKeys, OtFailure>::Err(size_check.UnwrapErr());
    }

    wire::PublicKeyOffer proto;
    if (!proto.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<ReceiverPublicKeys, OtFailure>::Err(
            OtFailure::Decode("Failed to parse public key offer"));
    }
    if (auto version_check = CheckVersion(proto.version(), "public key offer"); version_check.IsErr()) {
        return Result<ReceiverPublicKeys, OtFailure>::Err(version_check.UnwrapErr());
    }
    auto suite_result = FromWire(proto.suite());
    if (suite_result.IsErr()) {
        return Result<ReceiverPublicKeys, OtFailure>::Err(suite_result.UnwrapErr());
    }
    if (proto.slot0().empty() || proto.slot1().empty()) {
        return Result<ReceiverPublicKeys, OtFailure>::Err(
            OtFailure::Decode("Public key offer has an empty slot"));
    }

    const CipherSuite suite = suite_result.Unwrap();
    return Result<ReceiverPublicKeys, OtFailure>::Ok(
        ReceiverPublicKeys(
            PublicKey(suite, std::vector<uint8_t>(proto.slot0().begin(), proto.slot0().end())),
            PublicKey(suite, std::vector<uint8_t>(proto.slot1().begin(), proto.slot1().end()))));
}

Result<std::vector<uint8_t>, OtFailure> TransferCodec::EncodeResponse(const SenderResponse& response) {
    if (response.Ciphertext0().empty() || response.Ciphertext1().empty()) {
        return Result<std::vector<uint8_t>, OtFailure>::Err(
            OtFailure::Encode("Encrypted response has an empty slot"));
    }

    wire::EncryptedResponse proto;
    proto.set_version(TransferConstants::WIRE_VERSION);
    proto.set_ciphertext0(response.Ciphertext0().data(), response.Ciphertext0().size());
    proto.set_ciphertext1(response.Ciphertext1().data(), response.Ciphertext1().size());
    return SerializeDeterministic(proto);
}

Result<SenderResponse, OtFailure> TransferCodec::DecodeResponse(std::span<const uint8_t> bytes) {
    if (auto size_check = CheckInputSize(bytes, "Encrypted response"); size_check.IsErr()) {
        return Result<SenderResponse, OtFailure>::Err(size_check.UnwrapErr());
    }

    wire::EncryptedResponse proto;
    if (!proto.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<SenderResponse, OtFailure>::Err(
            OtFailure::Decode("Failed to parse encrypted response"));
    }
    if (auto version_check = CheckVersion(proto.version(), "encrypted response"); version_check.IsErr()) {
        return Result<SenderResponse, OtFailure>::Err(version_check.UnwrapErr());
    }
    if (proto.ciphertext0().empty() || proto.ciphertext1().empty()) {
        return Result<SenderResponse, OtFailure>::Err(
            OtFailure::Decode("Encrypted response has an empty slot"));
    }

    return Result<SenderResponse, OtFailure>::Ok(
        SenderResponse(
            std::vector<uint8_t>(proto.ciphertext0().begin(), proto.ciphertext0().end()),
            std::vector<uint8_t>(proto.ciphertext1().begin(), proto.ciphertext1().end())));
}

} // namespace otkit::protocol::serialization
