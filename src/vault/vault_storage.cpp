#include "keystr/vault/vault_storage.hpp"
#include "keystr/debug/logger.hpp"

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <system_error>

namespace keystr::vault {

namespace fs = std::filesystem;

FileVaultStorage::FileVaultStorage(fs::path path)
    : path_(std::move(path)) {}

Result<std::optional<std::vector<uint8_t>>, KeystrFailure> FileVaultStorage::Read() {
    using R = Result<std::optional<std::vector<uint8_t>>, KeystrFailure>;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return R::Ok(std::nullopt);
    }
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return R::Err(KeystrFailure::Storage("Vault file cannot be opened for reading"));
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return R::Err(KeystrFailure::Storage("Vault file read failed"));
    }
    if (bytes.empty()) {
        return R::Ok(std::nullopt);
    }
    return R::Ok(std::move(bytes));
}

Result<Unit, KeystrFailure> FileVaultStorage::Write(std::span<const uint8_t> record) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Result<Unit, KeystrFailure>::Err(
                KeystrFailure::Storage(fmt::format("Cannot create vault directory: {}", ec.message())));
        }
    }

    fs::path staging = path_;
    staging += ".tmp";
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<Unit, KeystrFailure>::Err(
                KeystrFailure::Storage("Vault file cannot be opened for writing"));
        }
        fs::permissions(staging, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        out.write(reinterpret_cast<const char*>(record.data()), static_cast<std::streamsize>(record.size()));
        out.flush();
        if (!out) {
            fs::remove(staging, ec);
            return Result<Unit, KeystrFailure>::Err(KeystrFailure::Storage("Vault file write failed"));
        }
    }

    fs::rename(staging, path_, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(staging, ec);
        return Result<Unit, KeystrFailure>::Err(
            KeystrFailure::Storage(fmt::format("Vault file replace failed: {}", reason)));
    }
    KEYSTR_LOG_DEBUG("storage", "wrote vault record ({} bytes)", record.size());
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<Unit, KeystrFailure> FileVaultStorage::Erase() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        return Result<Unit, KeystrFailure>::Err(
            KeystrFailure::Storage(fmt::format("Vault file removal failed: {}", ec.message())));
    }
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<std::optional<std::vector<uint8_t>>, KeystrFailure> MemoryVaultStorage::Read() {
    std::lock_guard<std::mutex> guard(lock_);
    return Result<std::optional<std::vector<uint8_t>>, KeystrFailure>::Ok(record_);
}

Result<Unit, KeystrFailure> MemoryVaultStorage::Write(std::span<const uint8_t> record) {
    std::lock_guard<std::mutex> guard(lock_);
    record_.emplace(record.begin(), record.end());
    ++write_count_;
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<Unit, KeystrFailure> MemoryVaultStorage::Erase() {
    std::lock_guard<std::mutex> guard(lock_);
    record_.reset();
    return Result<Unit, KeystrFailure>::Ok(unit);
}

size_t MemoryVaultStorage::WriteCount() const {
    std::lock_guard<std::mutex> guard(lock_);
    return write_count_;
}

}
