/**
 * @file basic_transfer_example.cpp
 * @brief One oblivious transfer, receiver and sender in a single process
 */

#include "otkit/crypto/sodium_interop.hpp"
#include "otkit/protocol/transfer/ot_receiver.hpp"
#include "otkit/protocol/transfer/ot_sender.hpp"
#include "otkit/serialization/transfer_codec.hpp"
#include "otkit/core/result.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace otkit::protocol;
using namespace otkit::protocol::crypto;
using namespace otkit::protocol::transfer;
using otkit::protocol::configuration::OtConfig;
using otkit::protocol::enums::Choice;
using otkit::protocol::serialization::TransferCodec;

namespace {
    std::vector<uint8_t> Bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    std::string Text(const std::vector<uint8_t>& bytes) {
        return std::string(bytes.begin(), bytes.end());
    }

    int Fail(const std::string& step, const OtFailure& failure) {
        std::cerr << "   ✗ " << step << " failed [" << ToString(failure.type) << "]: "
                  << failure.message << std::endl;
        return EXIT_FAILURE;
    }
}

int main(int argc, char** argv) {
    const bool post_quantum = argc > 1 && std::string(argv[1]) == "--pq";
    const OtConfig config = post_quantum ? OtConfig::PostQuantum() : OtConfig::Reference();

    std::cout << "=== otkit - 1-out-of-2 Oblivious Transfer Example ===" << std::endl;
    std::cout << "   Suite: " << otkit::protocol::enums::ToString(config.GetSuite())
              << ", key bits: " << config.GetKeyBits()
              << ", max message: " << config.EstimateMaxMessageSize() << " bytes" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: " << init_result.UnwrapErr().message << std::endl;
        return EXIT_FAILURE;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Receiver picks message ONE and generates keys..." << std::endl;
    auto receiver_result = ObliviousTransferReceiver::Create(Choice::One, config);
    if (receiver_result.IsErr()) {
        return Fail("Receiver creation", receiver_result.UnwrapErr());
    }
    auto receiver = std::move(receiver_result).Unwrap();

    auto offer_result = receiver->GeneratePublicKeys();
    if (offer_result.IsErr()) {
        return Fail("Key generation", offer_result.UnwrapErr());
    }
    auto offer_bytes_result = TransferCodec::EncodeOffer(offer_result.Unwrap());
    if (offer_bytes_result.IsErr()) {
        return Fail("Offer encoding", offer_bytes_result.UnwrapErr());
    }
    const auto offer_bytes = std::move(offer_bytes_result).Unwrap();
    std::cout << "   ✓ Offer with two public keys: " << offer_bytes.size() << " bytes on the wire" << std::endl;
    std::cout << "   Private keys retained: " << receiver->RetainedPrivateKeyCount() << std::endl;
    std::cout << std::endl;

    std::cout << "3. Sender encrypts both messages..." << std::endl;
    auto sender_result = ObliviousTransferSender::Create(Bytes("Secret Zero"), Bytes("Secret One!"), config);
    if (sender_result.IsErr()) {
        return Fail("Sender creation", sender_result.UnwrapErr());
    }
    auto sender = std::move(sender_result).Unwrap();

    auto received_offer = TransferCodec::DecodeOffer(offer_bytes);
    if (received_offer.IsErr()) {
        return Fail("Offer decoding", received_offer.UnwrapErr());
    }
    auto response_result = sender->EncryptMessages(received_offer.Unwrap());
    if (response_result.IsErr()) {
        return Fail("Encryption", response_result.UnwrapErr());
    }
    auto response_bytes_result = TransferCodec::EncodeResponse(response_result.Unwrap());
    if (response_bytes_result.IsErr()) {
        return Fail("Response encoding", response_bytes_result.UnwrapErr());
    }
    const auto response_bytes = std::move(response_bytes_result).Unwrap();
    std::cout << "   ✓ Response with two ciphertexts: " << response_bytes.size() << " bytes on the wire" << std::endl;
    std::cout << std::endl;

    std::cout << "4. Receiver decrypts its chosen message..." << std::endl;
    auto received_response = TransferCodec::DecodeResponse(response_bytes);
    if (received_response.IsErr()) {
        return Fail("Response decoding", received_response.UnwrapErr());
    }
    auto message_result = receiver->DecryptMessage(received_response.Unwrap());
    if (message_result.IsErr()) {
        return Fail("Decryption", message_result.UnwrapErr());
    }
    std::cout << "   ✓ Received: \"" << Text(message_result.Unwrap()) << "\"" << std::endl;
    std::cout << "   Receiver phase: " << ToString(receiver->GetPhase())
              << ", sender phase: " << ToString(sender->GetPhase()) << std::endl;
    std::cout << "   Private keys retained: " << receiver->RetainedPrivateKeyCount() << std::endl;
    std::cout << std::endl;

    std::cout << "=== Transfer complete ===" << std::endl;
    return EXIT_SUCCESS;
}
