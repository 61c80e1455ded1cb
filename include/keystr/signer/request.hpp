#pragma once

#include "keystr/crypto/secp256k1.hpp"
#include "keystr/signer/request_kind.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace keystr::signer {

using SessionId = crypto::XOnlyPublicKey;
using Clock = std::chrono::steady_clock;

enum class DecisionState : uint8_t {
    Pending,
    Approved,
    Rejected,
    Expired
};

constexpr std::string_view DecisionStateName(DecisionState state) noexcept {
    switch (state) {
        case DecisionState::Pending: return "Pending";
        case DecisionState::Approved: return "Approved";
        case DecisionState::Rejected: return "Rejected";
        case DecisionState::Expired: return "Expired";
    }
    return "Unknown";
}

enum class Decision : uint8_t {
    Approve,
    Reject
};

/// A request from a remote client, as held by the approval gate.
struct SignRequest {
    std::string id;
    RequestKind kind = RequestKind::Unknown;
    nlohmann::json params = nlohmann::json::array();
    SessionId session{};
    DecisionState state = DecisionState::Pending;
    Clock::time_point received_at{};
    nlohmann::json wire_id;

    /// Human-readable summary for an approval prompt. Never contains secrets.
    [[nodiscard]] std::string Describe() const;
};

/// Snapshot of a pending request handed to the UI.
struct PendingRequestView {
    std::string id;
    SessionId session{};
    std::string session_npub;
    RequestKind kind = RequestKind::Unknown;
    std::string description;
    Clock::time_point received_at{};
};

}
