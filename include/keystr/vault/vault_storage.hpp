#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace keystr::vault {

/// Byte-level home of the single vault record.
class IVaultStorage {
public:
    virtual ~IVaultStorage() = default;

    /// Ok(std::nullopt) when nothing has been stored yet.
    virtual Result<std::optional<std::vector<uint8_t>>, KeystrFailure> Read() = 0;

    virtual Result<Unit, KeystrFailure> Write(std::span<const uint8_t> record) = 0;

    virtual Result<Unit, KeystrFailure> Erase() = 0;
};

/**
 * Stores the record in one file. Writes go to "<path>.tmp" first and are
 * renamed over the target, so a crash never leaves a half-written vault.
 * The file is restricted to owner read/write.
 */
class FileVaultStorage final : public IVaultStorage {
public:
    explicit FileVaultStorage(std::filesystem::path path);

    Result<std::optional<std::vector<uint8_t>>, KeystrFailure> Read() override;
    Result<Unit, KeystrFailure> Write(std::span<const uint8_t> record) override;
    Result<Unit, KeystrFailure> Erase() override;

    [[nodiscard]] const std::filesystem::path& GetPath() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

class MemoryVaultStorage final : public IVaultStorage {
public:
    Result<std::optional<std::vector<uint8_t>>, KeystrFailure> Read() override;
    Result<Unit, KeystrFailure> Write(std::span<const uint8_t> record) override;
    Result<Unit, KeystrFailure> Erase() override;

    [[nodiscard]] size_t WriteCount() const;

private:
    mutable std::mutex lock_;
    std::optional<std::vector<uint8_t>> record_;
    size_t write_count_ = 0;
};

}
