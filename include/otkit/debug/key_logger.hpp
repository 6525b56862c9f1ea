#pragma once

/**
 * @file key_logger.hpp
 * @brief Debug tracing of transfer sessions.
 *
 * Only public material is traced: offered public keys, ciphertext sizes and
 * phase changes. Private keys, the decoy and message plaintexts have no
 * logging entry point.
 *
 * Enable via CMake: -DOTKIT_DEBUG_KEYS=ON
 */

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <span>
#include <string>

namespace otkit::debug {

enum class Side {
    Sender,
    Receiver,
    Unknown
};

#ifdef OTKIT_DEBUG_KEYS

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 32) {
    if (data.size() <= max_bytes) {
        return ToHex(data);
    }
    auto truncated = ToHex(data.subspan(0, max_bytes));
    truncated += "...(" + std::to_string(data.size()) + " bytes)";
    return truncated;
}

inline const char* SideToString(Side side) {
    switch (side) {
        case Side::Sender: return "SENDER";
        case Side::Receiver: return "RECEIVER";
        default: return "UNKNOWN";
    }
}

#define OT_LOG_KEY(side, operation, key_name, data) \
    do { \
        fprintf(stdout, "[OT-DEBUG] %s %s %s: %s\n", \
            ::otkit::debug::SideToString(side), \
            operation, \
            key_name, \
            ::otkit::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define OT_LOG_VALUE(side, operation, name, value) \
    do { \
        fprintf(stdout, "[OT-DEBUG] %s %s %s: %s\n", \
            ::otkit::debug::SideToString(side), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define OT_LOG_MSG(side, operation, message) \
    do { \
        fprintf(stdout, "[OT-DEBUG] %s %s %s\n", \
            ::otkit::debug::SideToString(side), \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

#define OT_LOG_SECTION(side, section_name) \
    do { \
        fprintf(stdout, "[OT-DEBUG] %s ========== %s ==========\n", \
            ::otkit::debug::SideToString(side), \
            section_name); \
        fflush(stdout); \
    } while(0)

inline void LogPublicKeyOffer(
    Side side,
    const char* suite,
    std::span<const uint8_t> slot0,
    std::span<const uint8_t> slot1) {

    OT_LOG_SECTION(side, "PUBLIC KEY OFFER");
    OT_LOG_MSG(side, "OFFER", suite);
    OT_LOG_KEY(side, "OFFER", "slot0", slot0);
    OT_LOG_KEY(side, "OFFER", "slot1", slot1);
}

inline void LogSenderResponse(
    Side side,
    size_t ciphertext0_size,
    size_t ciphertext1_size) {

    OT_LOG_SECTION(side, "ENCRYPTED RESPONSE");
    OT_LOG_VALUE(side, "RESPONSE", "ciphertext0_size", ciphertext0_size);
    OT_LOG_VALUE(side, "RESPONSE", "ciphertext1_size", ciphertext1_size);
}

inline void LogPhaseChange(Side side, const char* from, const char* to) {
    fprintf(stdout, "[OT-DEBUG] %s PHASE %s -> %s\n",
        SideToString(side), from, to);
    fflush(stdout);
}

inline void LogFailure(Side side, const char* operation, const std::string& message) {
    OT_LOG_MSG(side, operation, message.c_str());
}

#else // !OTKIT_DEBUG_KEYS

#define OT_LOG_KEY(side, operation, key_name, data) ((void)0)
#define OT_LOG_VALUE(side, operation, name, value) ((void)0)
#define OT_LOG_MSG(side, operation, message) ((void)0)
#define OT_LOG_SECTION(side, section_name) ((void)0)

inline void LogPublicKeyOffer(Side, const char*, std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogSenderResponse(Side, size_t, size_t) {}
inline void LogPhaseChange(Side, const char*, const char*) {}
inline void LogFailure(Side, const char*, const std::string&) {}

#endif // OTKIT_DEBUG_KEYS

} // namespace otkit::debug
