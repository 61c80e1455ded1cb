#include "keystr/configuration/keystr_config.hpp"

#include <fmt/format.h>

namespace keystr::configuration {

Result<Unit, KeystrFailure> VaultConfig::Validate() const {
    if (scrypt_log_n_ < kMinScryptLogN || scrypt_log_n_ > kMaxScryptLogN) {
        return Result<Unit, KeystrFailure>::Err(
            KeystrFailure::InvalidState(
                fmt::format("scrypt log_n must be within [{}, {}], got {}",
                    kMinScryptLogN, kMaxScryptLogN, scrypt_log_n_)));
    }
    return Result<Unit, KeystrFailure>::Ok(unit);
}

Result<Unit, KeystrFailure> SignerConfig::Validate() const {
    if (approval_timeout_.count() <= 0) {
        return Result<Unit, KeystrFailure>::Err(
            KeystrFailure::InvalidState("Approval timeout must be positive"));
    }
    if (worker_queue_capacity_ == 0) {
        return Result<Unit, KeystrFailure>::Err(
            KeystrFailure::InvalidState("Worker queue capacity must be positive"));
    }
    if (max_pending_requests_ == 0) {
        return Result<Unit, KeystrFailure>::Err(
            KeystrFailure::InvalidState("Pending request limit must be positive"));
    }
    if (IsPreApproved(signer::RequestKind::Unknown)) {
        return Result<Unit, KeystrFailure>::Err(
            KeystrFailure::InvalidState("Unknown methods cannot be pre-approved"));
    }
    return Result<Unit, KeystrFailure>::Ok(unit);
}

}
