#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace otkit::protocol {
struct Constants {
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t SHA_256_DIGEST_SIZE = 32;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct RsaConstants {
    static constexpr uint32_t REFERENCE_MODULUS_BITS = 1024;
    static constexpr uint32_t DEFAULT_MODULUS_BITS = 2048;
    static constexpr uint32_t HIGH_SECURITY_MODULUS_BITS = 4096;
    static constexpr uint32_t MIN_MODULUS_BITS = 1024;
    static constexpr uint32_t MAX_MODULUS_BITS = 16384;
    static constexpr uint32_t PUBLIC_EXPONENT = 65537;
    // OAEP with SHA-256: k - 2 * hLen - 2
    static constexpr size_t OAEP_SHA256_OVERHEAD = 2 * Constants::SHA_256_DIGEST_SIZE + 2;
};
struct TransferConstants {
    static constexpr uint32_t WIRE_VERSION = 1;
    static constexpr uint8_t SLOT_ZERO = 0;
    static constexpr uint8_t SLOT_ONE = 1;
    static constexpr size_t MAX_WIRE_MESSAGE_SIZE = 1024 * 1024;
};
struct KemDemConstants {
    static constexpr uint32_t KYBER_768_KEY_BITS = 768;
    static constexpr size_t KYBER_768_CIPHERTEXT_SIZE = 1088;
    // kem_ct || nonce || aead_ct || tag
    static constexpr size_t CIPHERTEXT_OVERHEAD =
        KYBER_768_CIPHERTEXT_SIZE + Constants::AES_GCM_NONCE_SIZE + Constants::AES_GCM_TAG_SIZE;
    // Both ciphertexts of a response must fit one wire message
    static constexpr size_t MAX_PLAINTEXT_SIZE = 256 * 1024;
    static constexpr std::string_view KEY_DERIVATION_INFO = "otkit-kem-dem-v1";
    static constexpr std::string_view KEY_DERIVATION_SALT = "otkit-kyber768-aes256gcm";
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view KEYS_ALREADY_GENERATED = "Public keys were already generated for this session";
    static constexpr std::string_view KEYS_NOT_GENERATED = "Invalid protocol state: private key not generated";
    static constexpr std::string_view SESSION_ABORTED = "Session was aborted by an earlier failure";
    static constexpr std::string_view SESSION_COMPLETED = "Session already completed";
    static constexpr std::string_view MESSAGES_ALREADY_ENCRYPTED = "Messages were already encrypted for this session";
    static constexpr std::string_view AES_GCM_DECRYPTION_FAILED = "AES-GCM decryption failed (authentication tag mismatch)";
};
}
