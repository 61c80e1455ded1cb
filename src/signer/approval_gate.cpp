#include "keystr/signer/approval_gate.hpp"
#include "keystr/core/constants.hpp"
#include "keystr/debug/logger.hpp"

#include <algorithm>

namespace keystr::signer {

namespace {

constexpr std::string_view kComponent = "gate";

}

ApprovalGate::ApprovalGate(size_t capacity, std::chrono::milliseconds timeout)
    : capacity_(capacity)
    , timeout_(timeout) {}

Result<EnqueueOutcome, KeystrFailure> ApprovalGate::Enqueue(SignRequest request) {
    using R = Result<EnqueueOutcome, KeystrFailure>;

    std::lock_guard<std::mutex> guard(lock_);
    request.state = DecisionState::Pending;

    const auto existing = std::find_if(pending_.begin(), pending_.end(), [&](const SignRequest& entry) {
        return entry.session == request.session && entry.id == request.id;
    });
    if (existing != pending_.end()) {
        KEYSTR_LOG_DEBUG(kComponent, "request {} from {} retried, replacing pending entry",
                         request.id, debug::ShortKey(request.session));
        *existing = std::move(request);
        return R::Ok(EnqueueOutcome::Replaced);
    }

    if (pending_.size() >= capacity_) {
        return R::Err(KeystrFailure::InvalidState(std::string(ErrorMessages::QUEUE_FULL)));
    }
    pending_.push_back(std::move(request));
    return R::Ok(EnqueueOutcome::Added);
}

Result<SignRequest, KeystrFailure> ApprovalGate::ResolveAt(size_t index, Decision decision) {
    SignRequest resolved = std::move(pending_[index]);
    pending_.erase(pending_.begin() + static_cast<std::ptrdiff_t>(index));
    resolved.state = decision == Decision::Approve ? DecisionState::Approved : DecisionState::Rejected;
    return Result<SignRequest, KeystrFailure>::Ok(std::move(resolved));
}

Result<SignRequest, KeystrFailure> ApprovalGate::Decide(const SessionId& session,
                                                        std::string_view id,
                                                        Decision decision) {
    std::lock_guard<std::mutex> guard(lock_);
    for (size_t i = 0; i < pending_.size(); ++i) {
        if (pending_[i].session == session && pending_[i].id == id) {
            return ResolveAt(i, decision);
        }
    }
    return Result<SignRequest, KeystrFailure>::Err(
        KeystrFailure::UnknownRequest(std::string(ErrorMessages::REQUEST_NOT_PENDING)));
}

Result<SignRequest, KeystrFailure> ApprovalGate::Decide(std::string_view id, Decision decision) {
    std::lock_guard<std::mutex> guard(lock_);
    for (size_t i = 0; i < pending_.size(); ++i) {
        if (pending_[i].id == id) {
            return ResolveAt(i, decision);
        }
    }
    return Result<SignRequest, KeystrFailure>::Err(
        KeystrFailure::UnknownRequest(std::string(ErrorMessages::REQUEST_NOT_PENDING)));
}

std::vector<SignRequest> ApprovalGate::ExpireStale(Clock::time_point now) {
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<SignRequest> expired;
    auto keep = pending_.begin();
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        if (now - it->received_at >= timeout_) {
            it->state = DecisionState::Expired;
            expired.push_back(std::move(*it));
        } else {
            if (keep != it) {
                *keep = std::move(*it);
            }
            ++keep;
        }
    }
    pending_.erase(keep, pending_.end());
    return expired;
}

std::vector<SignRequest> ApprovalGate::CancelSession(const SessionId& session) {
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<SignRequest> cancelled;
    auto keep = pending_.begin();
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        if (it->session == session) {
            it->state = DecisionState::Expired;
            cancelled.push_back(std::move(*it));
        } else {
            if (keep != it) {
                *keep = std::move(*it);
            }
            ++keep;
        }
    }
    pending_.erase(keep, pending_.end());
    return cancelled;
}

std::vector<SignRequest> ApprovalGate::List() const {
    std::lock_guard<std::mutex> guard(lock_);
    return pending_;
}

size_t ApprovalGate::PendingCount() const {
    std::lock_guard<std::mutex> guard(lock_);
    return pending_.size();
}

std::optional<Clock::time_point> ApprovalGate::NextDeadline() const {
    std::lock_guard<std::mutex> guard(lock_);
    if (pending_.empty()) {
        return std::nullopt;
    }
    const auto oldest = std::min_element(pending_.begin(), pending_.end(),
        [](const SignRequest& a, const SignRequest& b) { return a.received_at < b.received_at; });
    return oldest->received_at + timeout_;
}

}
