#pragma once

#include "keystr/signer/request.hpp"

#include <string>

namespace keystr::interfaces {

/// UI-facing notifications. Called without engine locks held, possibly
/// from a worker thread.
class ISignerEventHandler {
public:
    virtual ~ISignerEventHandler() = default;

    virtual void OnSessionOpened(const signer::SessionId& session) = 0;
    virtual void OnSessionClosed(const signer::SessionId& session) = 0;
    virtual void OnRequestPending(const signer::PendingRequestView& request) = 0;
    virtual void OnRequestResolved(const signer::SessionId& session,
                                   const std::string& request_id,
                                   signer::DecisionState state) = 0;
};

}
