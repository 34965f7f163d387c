#include <favorite_colors/mcp/jsonrpc.hpp>

namespace favorite_colors {

namespace {

using ParseResult = Result<JsonRpcRequest, std::string>;

nlohmann::json MakeEnvelope(const std::optional<nlohmann::json>& id) {
    nlohmann::json envelope = {{"jsonrpc", kJsonRpcVersion}};
    if (id.has_value()) {
        envelope["id"] = *id;
    }
    return envelope;
}

} // anonymous namespace

ParseResult ParseRequest(const nlohmann::json& message) {
    if (!message.is_object()) {
        return ParseResult::Err("request must be a JSON object");
    }

    JsonRpcRequest request;

    auto version_it = message.find("jsonrpc");
    if (version_it != message.end() && !version_it->is_null()) {
        if (!version_it->is_string()) {
            return ParseResult::Err("jsonrpc must be a string");
        }
        request.jsonrpc = version_it->get<std::string>();
    }

    auto method_it = message.find("method");
    if (method_it != message.end() && !method_it->is_null()) {
        if (!method_it->is_string()) {
            return ParseResult::Err("method must be a string");
        }
        request.method = method_it->get<std::string>();
    }

    auto id_it = message.find("id");
    if (id_it != message.end() && !id_it->is_null()) {
        request.id = *id_it;
    }

    auto params_it = message.find("params");
    if (params_it != message.end()) {
        request.params = *params_it;
    }

    return ParseResult::Ok(std::move(request));
}

nlohmann::json MakeResultResponse(const std::optional<nlohmann::json>& id,
                                  const nlohmann::json& result) {
    auto envelope = MakeEnvelope(id);
    envelope["result"] = result;
    return envelope;
}

nlohmann::json MakeErrorResponse(const std::optional<nlohmann::json>& id,
                                 const RpcError& error) {
    nlohmann::json body = {
        {"code", error.code},
        {"message", error.message}
    };
    if (error.data.has_value()) {
        body["data"] = *error.data;
    }

    auto envelope = MakeEnvelope(id);
    envelope["error"] = std::move(body);
    return envelope;
}

} // namespace favorite_colors
