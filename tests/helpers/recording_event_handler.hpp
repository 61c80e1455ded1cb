#pragma once
#include "keystr/interfaces/i_signer_event_handler.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace keystr::test_helpers {

struct ResolvedEvent {
    signer::SessionId session{};
    std::string request_id;
    signer::DecisionState state = signer::DecisionState::Pending;
};

class RecordingEventHandler : public interfaces::ISignerEventHandler {
public:
    void OnSessionOpened(const signer::SessionId& session) override {
        std::lock_guard<std::mutex> guard(lock_);
        opened_.push_back(session);
    }

    void OnSessionClosed(const signer::SessionId& session) override {
        std::lock_guard<std::mutex> guard(lock_);
        closed_.push_back(session);
    }

    void OnRequestPending(const signer::PendingRequestView& request) override {
        std::lock_guard<std::mutex> guard(lock_);
        pending_.push_back(request);
    }

    void OnRequestResolved(const signer::SessionId& session,
                           const std::string& request_id,
                           const signer::DecisionState state) override {
        std::lock_guard<std::mutex> guard(lock_);
        resolved_.push_back(ResolvedEvent{session, request_id, state});
    }

    [[nodiscard]] std::vector<signer::SessionId> Opened() const {
        std::lock_guard<std::mutex> guard(lock_);
        return opened_;
    }
    [[nodiscard]] std::vector<signer::SessionId> Closed() const {
        std::lock_guard<std::mutex> guard(lock_);
        return closed_;
    }
    [[nodiscard]] std::vector<signer::PendingRequestView> Pending() const {
        std::lock_guard<std::mutex> guard(lock_);
        return pending_;
    }
    [[nodiscard]] std::vector<ResolvedEvent> Resolved() const {
        std::lock_guard<std::mutex> guard(lock_);
        return resolved_;
    }

private:
    mutable std::mutex lock_;
    std::vector<signer::SessionId> opened_;
    std::vector<signer::SessionId> closed_;
    std::vector<signer::PendingRequestView> pending_;
    std::vector<ResolvedEvent> resolved_;
};

}
