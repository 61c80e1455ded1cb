#include "keystr/signer/message_codec.hpp"

namespace keystr::signer {

using json = nlohmann::json;

namespace {

// Peer-supplied text may not be valid UTF-8; it is replaced, never thrown on.
std::string Dump(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

}

RpcResponse RpcResponse::Success(std::string id, json result) {
    RpcResponse response;
    response.id = std::move(id);
    response.result = std::move(result);
    return response;
}

RpcResponse RpcResponse::Failure(std::string id, const KeystrFailure& failure) {
    RpcResponse response;
    response.id = std::move(id);
    response.error = failure.ToWireError();
    return response;
}

Result<Envelope, KeystrFailure> MessageCodec::Parse(std::string_view text) {
    using R = Result<Envelope, KeystrFailure>;

    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return R::Err(KeystrFailure::InvalidRequest("Payload is not valid JSON"));
    }
    if (!parsed.is_object()) {
        return R::Err(KeystrFailure::InvalidRequest("Payload is not a JSON object"));
    }

    Envelope envelope;
    const bool has_method = parsed.contains("method");
    const bool has_outcome = parsed.contains("result") || parsed.contains("error");
    envelope.kind = (!has_method && has_outcome) ? EnvelopeKind::Response : EnvelopeKind::Request;

    if (const auto it = parsed.find("id"); it != parsed.end()) {
        if (it->is_string()) {
            envelope.id = it->get<std::string>();
            envelope.wire_id = *it;
        } else if (it->is_number_integer()) {
            envelope.id = it->dump();
            envelope.wire_id = *it;
        }
    }
    envelope.body = std::move(parsed);
    return R::Ok(std::move(envelope));
}

Result<RpcRequest, KeystrFailure> MessageCodec::DecodeRequest(const Envelope& envelope) {
    using R = Result<RpcRequest, KeystrFailure>;

    if (envelope.kind != EnvelopeKind::Request) {
        return R::Err(KeystrFailure::InvalidRequest("Envelope is not a request"));
    }
    if (!envelope.id.has_value() || envelope.id->empty()) {
        return R::Err(KeystrFailure::InvalidRequest("Request has no id"));
    }

    const auto method = envelope.body.find("method");
    if (method == envelope.body.end() || !method->is_string()) {
        return R::Err(KeystrFailure::InvalidRequest("Request method must be a string"));
    }

    RpcRequest request;
    request.id = *envelope.id;
    request.wire_id = envelope.wire_id;
    request.method = method->get<std::string>();

    if (const auto params = envelope.body.find("params"); params != envelope.body.end() && !params->is_null()) {
        if (!params->is_array()) {
            return R::Err(KeystrFailure::InvalidRequest("Request params must be an array"));
        }
        request.params = *params;
    }
    return R::Ok(std::move(request));
}

Result<RpcResponse, KeystrFailure> MessageCodec::DecodeResponse(const Envelope& envelope) {
    using R = Result<RpcResponse, KeystrFailure>;

    if (envelope.kind != EnvelopeKind::Response || !envelope.id.has_value()) {
        return R::Err(KeystrFailure::InvalidRequest("Envelope is not a response"));
    }

    RpcResponse response;
    response.id = *envelope.id;
    response.wire_id = envelope.wire_id;
    if (const auto error = envelope.body.find("error"); error != envelope.body.end() && !error->is_null()) {
        if (!error->is_string()) {
            return R::Err(KeystrFailure::InvalidRequest("Response error must be a string"));
        }
        response.error = error->get<std::string>();
    }
    if (const auto result = envelope.body.find("result"); result != envelope.body.end()) {
        response.result = *result;
    }
    return R::Ok(std::move(response));
}

std::string MessageCodec::EncodeRequest(const RpcRequest& request) {
    return Dump(json{
        {"id", request.wire_id.is_null() ? json(request.id) : request.wire_id},
        {"method", request.method},
        {"params", request.params}
    });
}

std::string MessageCodec::EncodeResponse(const RpcResponse& response) {
    json out = {{"id", response.wire_id.is_null() ? json(response.id) : response.wire_id}};
    if (response.error.has_value()) {
        out["error"] = *response.error;
    } else {
        out["result"] = response.result;
    }
    return Dump(out);
}

}
