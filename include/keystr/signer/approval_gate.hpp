#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"
#include "keystr/signer/request.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace keystr::signer {

enum class EnqueueOutcome : uint8_t {
    Added,
    Replaced
};

/**
 * @brief Requests waiting for a human decision, in arrival order.
 *
 * Decisions resolve entries out of order. Every method that resolves a
 * request removes it and returns it with its final DecisionState, so the
 * caller sends exactly one response per request.
 *
 * A request with the same (session, id) as a pending one is a retry: it
 * replaces the earlier entry in place and restarts its timeout.
 *
 * Thread Safety: all methods are thread-safe.
 */
class ApprovalGate {
public:
    ApprovalGate(size_t capacity, std::chrono::milliseconds timeout);

    ApprovalGate(const ApprovalGate&) = delete;
    ApprovalGate& operator=(const ApprovalGate&) = delete;

    /// InvalidState when the gate already holds capacity requests.
    Result<EnqueueOutcome, KeystrFailure> Enqueue(SignRequest request);

    /// UnknownRequest unless (session, id) is pending.
    Result<SignRequest, KeystrFailure> Decide(const SessionId& session, std::string_view id, Decision decision);

    /// Oldest pending request with @p id across all sessions.
    Result<SignRequest, KeystrFailure> Decide(std::string_view id, Decision decision);

    /// Removes requests received at least timeout before @p now, marked Expired.
    std::vector<SignRequest> ExpireStale(Clock::time_point now);

    /// Removes every request of @p session, marked Expired.
    std::vector<SignRequest> CancelSession(const SessionId& session);

    [[nodiscard]] std::vector<SignRequest> List() const;

    [[nodiscard]] size_t PendingCount() const;

    /// Earliest instant at which ExpireStale() will remove something.
    [[nodiscard]] std::optional<Clock::time_point> NextDeadline() const;

    [[nodiscard]] std::chrono::milliseconds GetTimeout() const noexcept { return timeout_; }

private:
    Result<SignRequest, KeystrFailure> ResolveAt(size_t index, Decision decision);

    const size_t capacity_;
    const std::chrono::milliseconds timeout_;

    mutable std::mutex lock_;
    std::vector<SignRequest> pending_;
};

}
