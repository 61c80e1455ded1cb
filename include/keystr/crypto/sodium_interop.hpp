#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "keystr/core/constants.hpp"

#include <sodium.h>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace keystr::crypto {

/**
 * @brief Static entry point to the libsodium primitives keystr relies on.
 *
 * Initialize() must succeed before any other call; it is thread-safe
 * and idempotent.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Overwrite a buffer with zeros in a way the optimizer cannot elide.
     */
    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    /**
     * @brief Constant-time comparison. Buffers of different size compare unequal.
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void FillRandom(std::span<uint8_t> buffer) noexcept;

    /// Random identifier for outbound requests (hex, 2 * byte_count chars).
    static std::string RandomHexId(size_t byte_count = kRequestIdBytes);

    // ========================================================================
    // Hashing
    // ========================================================================

    static std::array<uint8_t, kDigestBytes> Sha256(std::span<const uint8_t> data) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}
