#pragma once

#include "keystr/core/result.hpp"
#include "keystr/core/failures.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace keystr::signer {

/// {"id": "...", "method": "...", "params": [...]}
struct RpcRequest {
    std::string id;
    std::string method;
    nlohmann::json params = nlohmann::json::array();
    /// Id exactly as the peer sent it (string or integer); null when the id originated here.
    nlohmann::json wire_id;
};

/// {"id": "...", "result": ...} or {"id": "...", "error": "..."}
struct RpcResponse {
    std::string id;
    nlohmann::json result;
    std::optional<std::string> error;
    /// Echoed in place of id when set, so a numeric request id comes back numeric.
    nlohmann::json wire_id;

    static RpcResponse Success(std::string id, nlohmann::json result);

    /// Error text is "<FailureTypeName>: <message>".
    static RpcResponse Failure(std::string id, const KeystrFailure& failure);

    [[nodiscard]] bool IsError() const noexcept { return error.has_value(); }
};

enum class EnvelopeKind : uint8_t {
    Request,
    Response
};

/// Decrypted payload after the first, structural pass.
struct Envelope {
    EnvelopeKind kind = EnvelopeKind::Request;
    std::optional<std::string> id;
    nlohmann::json body;
    nlohmann::json wire_id;
};

/**
 * JSON-RPC-like framing of the signer protocol.
 *
 * Parsing happens in two passes so that a request whose method or params
 * are malformed can still be answered under its id: Parse() only needs a
 * JSON object, DecodeRequest() validates the rest.
 */
class MessageCodec {
public:
    /// InvalidRequest unless @p text is a JSON object.
    static Result<Envelope, KeystrFailure> Parse(std::string_view text);

    /// InvalidRequest for a missing method or non-array params. Absent params decode as [].
    static Result<RpcRequest, KeystrFailure> DecodeRequest(const Envelope& envelope);

    static Result<RpcResponse, KeystrFailure> DecodeResponse(const Envelope& envelope);

    static std::string EncodeRequest(const RpcRequest& request);

    static std::string EncodeResponse(const RpcResponse& response);

private:
    MessageCodec() = delete;
};

}
