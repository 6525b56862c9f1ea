#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
namespace otkit::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class CipherFailureType {
    KeyGeneration,
    Encoding,
    Decryption,
    InvalidKey,
    Backend
};
enum class OtFailureType {
    InvalidChoice,
    KeyGenerationFailed,
    EncryptionFailed,
    ProtocolStateError,
    DecryptionFailed,
    InvalidInput,
    Encode,
    Decode
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Failure reported by an asymmetric cipher backend.
class CipherFailure {
public:
    CipherFailureType type;
    std::string message;
    CipherFailure(const CipherFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CipherFailure KeyGeneration(std::string msg) {
        return {CipherFailureType::KeyGeneration, std::move(msg)};
    }
    /// Plaintext does not fit the payload limit of the key.
    static CipherFailure Encoding(std::string msg) {
        return {CipherFailureType::Encoding, std::move(msg)};
    }
    /// Malformed ciphertext, padding check or tag verification failure.
    static CipherFailure Decryption(std::string msg) {
        return {CipherFailureType::Decryption, std::move(msg)};
    }
    static CipherFailure InvalidKey(std::string msg) {
        return {CipherFailureType::InvalidKey, std::move(msg)};
    }
    static CipherFailure Backend(std::string msg) {
        return {CipherFailureType::Backend, std::move(msg)};
    }
    static CipherFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Backend(sf.message);
    }
};

/// Failure of an oblivious transfer session.
///
/// Every value of this type returned by a session operation means the
/// session has been aborted.
class OtFailure {
public:
    OtFailureType type;
    std::string message;
    /// Offending slot, set only for EncryptionFailed.
    std::optional<uint8_t> slot;
    OtFailure(const OtFailureType t, std::string msg, std::optional<uint8_t> failed_slot = std::nullopt)
        : type(t), message(std::move(msg)), slot(failed_slot) {}
    static OtFailure InvalidChoice(std::string msg) {
        return {OtFailureType::InvalidChoice, std::move(msg)};
    }
    static OtFailure KeyGenerationFailed(std::string msg) {
        return {OtFailureType::KeyGenerationFailed, std::move(msg)};
    }
    static OtFailure EncryptionFailed(const uint8_t failed_slot, std::string msg) {
        return {OtFailureType::EncryptionFailed, std::move(msg), failed_slot};
    }
    static OtFailure ProtocolStateError(std::string msg) {
        return {OtFailureType::ProtocolStateError, std::move(msg)};
    }
    static OtFailure DecryptionFailed(std::string msg) {
        return {OtFailureType::DecryptionFailed, std::move(msg)};
    }
    static OtFailure InvalidInput(std::string msg) {
        return {OtFailureType::InvalidInput, std::move(msg)};
    }
    static OtFailure Encode(std::string msg) {
        return {OtFailureType::Encode, std::move(msg)};
    }
    static OtFailure Decode(std::string msg) {
        return {OtFailureType::Decode, std::move(msg)};
    }
};
constexpr std::string_view ToString(const OtFailureType type) noexcept {
    switch (type) {
        case OtFailureType::InvalidChoice: return "InvalidChoice";
        case OtFailureType::KeyGenerationFailed: return "KeyGenerationFailed";
        case OtFailureType::EncryptionFailed: return "EncryptionFailed";
        case OtFailureType::ProtocolStateError: return "ProtocolStateError";
        case OtFailureType::DecryptionFailed: return "DecryptionFailed";
        case OtFailureType::InvalidInput: return "InvalidInput";
        case OtFailureType::Encode: return "Encode";
        case OtFailureType::Decode: return "Decode";
    }
    return "Unknown";
}
}
