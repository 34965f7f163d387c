#pragma once

#include <favorite_colors/core/result.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace favorite_colors {

constexpr const char* kJsonRpcVersion = "2.0";

// JSON-RPC error codes used by this server.
constexpr int kParseError     = -32700;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams  = -32602;
constexpr int kInternalError  = -32603;

// ---------------------------------------------------------------------------
// RpcError: the "error" member of a response envelope.
// ---------------------------------------------------------------------------
struct RpcError {
    int code = kInternalError;
    std::string message;
    std::optional<nlohmann::json> data;
};

// ---------------------------------------------------------------------------
// JsonRpcRequest: a decoded request envelope. `id` is empty when the
// request carried none (or carried null); it is then omitted from the reply.
// ---------------------------------------------------------------------------
struct JsonRpcRequest {
    std::string jsonrpc;
    std::optional<nlohmann::json> id;
    std::string method;
    nlohmann::json params;  // null when absent
};

/// Decode a request envelope. Fails when the value is not an object or when
/// `jsonrpc`/`method` are present with a non-string type. Unknown members are
/// ignored and the version tag is not checked.
Result<JsonRpcRequest, std::string> ParseRequest(const nlohmann::json& message);

nlohmann::json MakeResultResponse(const std::optional<nlohmann::json>& id,
                                  const nlohmann::json& result);

nlohmann::json MakeErrorResponse(const std::optional<nlohmann::json>& id,
                                 const RpcError& error);

} // namespace favorite_colors
