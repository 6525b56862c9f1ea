#pragma once

#include "otkit/core/result.hpp"
#include "otkit/core/failures.hpp"
#include "otkit/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace otkit::protocol::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Owns library initialisation, secure wiping, the CSPRNG and guarded
 * allocations. Every secret the library holds (private keys, sender
 * messages, derived symmetric keys) passes through here.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Must be called before any other operation of this library.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones with
     * sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    /// Bytes from randombytes_buf.
    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Allocate guarded memory with sodium_malloc
     *
     * Guard pages on both sides, locked in RAM, zeroed by FreeSecure.
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace otkit::protocol::crypto
