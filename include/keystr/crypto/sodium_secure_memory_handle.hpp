#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "keystr/core/constants.hpp"

#include <span>
#include <string>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace keystr::crypto {

/**
 * @brief Move-only owner of a sodium_malloc allocation.
 *
 * The region is guard-paged, locked in RAM and zeroed by sodium_free
 * when the handle is destroyed. Secret keys, derived vault keys and
 * session shared secrets only ever live in one of these.
 *
 * Access goes through WithReadAccess / WithWriteAccess so callers never
 * hold a copy outside secure memory:
 * @code
 * auto sig = handle.WithReadAccess([&](std::span<const uint8_t> sk) {
 *     return Secp256k1::SignSchnorr(sk, digest);
 * });
 * @endcode
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /// Allocates and copies @p data in. The caller still owns (and should wipe) @p data.
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /// Copies @p data to the start of the region and zero-fills the remainder.
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /// Zeroes the region without releasing it.
    void Wipe() noexcept;

    template<typename F>
    auto WithReadAccess(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::ObjectDisposed(std::string(ErrorMessages::HANDLE_DISPOSED)));
        }
        std::span<const uint8_t> view(static_cast<const uint8_t*>(ptr_), size_);
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(view));
    }

    template<typename F>
    auto WithWriteAccess(F&& func)
        -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::ObjectDisposed(std::string(ErrorMessages::HANDLE_DISPOSED)));
        }
        std::span<uint8_t> view(static_cast<uint8_t*>(ptr_), size_);
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(view));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

}
