#include <favorite_colors/mcp/mcp_server.hpp>

#include <favorite_colors/core/log.hpp>
#include <favorite_colors/core/version.hpp>

#include <string>

namespace favorite_colors {

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), in_(in), out_(out) {}

void McpServer::Run() {
    LogInfo("stdio", "Favorite Colors MCP Server starting (stdio transport)...");
    LogInfo("stdio", "Available tools: add_color, get_colors, remove_color, clear_colors");

    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty()) continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            // No parse-error reply on stdio; the HTTP path does send one.
            LogWarn("stdio", std::string("Error parsing request: ") + e.what());
            continue;
        }

        auto response = HandleMessage(message);
        if (!response) {
            continue;
        }
        out_ << response->dump() << "\n";
        out_.flush();
    }

    if (in_.bad()) {
        LogError("stdio", "Error reading input");
    }
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) const {
    auto request = ParseRequest(message);
    if (request.IsErr()) {
        LogWarn("mcp", "Error parsing request: " + request.Error());
        return std::nullopt;
    }
    return HandleRequest(request.Value());
}

nlohmann::json McpServer::HandleRequest(const JsonRpcRequest& request) const {
    LogDebug("mcp", "method=" + request.method +
                        " id=" + (request.id ? request.id->dump() : "<none>"));

    if (request.method == "initialize") {
        return HandleInitialize(request);
    } else if (request.method == "tools/list") {
        return HandleToolsList(request);
    } else if (request.method == "tools/call") {
        return HandleToolsCall(request);
    }
    return MakeErrorResponse(request.id,
                             RpcError{kMethodNotFound, "Method not found", std::nullopt});
}

nlohmann::json McpServer::HandleInitialize(const JsonRpcRequest& request) const {
    nlohmann::json result;
    result["protocolVersion"] = kMcpProtocolVersion;
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };

    return MakeResultResponse(request.id, result);
}

nlohmann::json McpServer::HandleToolsList(const JsonRpcRequest& request) const {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResultResponse(request.id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(const JsonRpcRequest& request) const {
    const auto& params = request.params;
    if (!params.is_object()) {
        return MakeErrorResponse(request.id,
                                 RpcError{kInvalidParams, "Invalid params", std::nullopt});
    }

    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return MakeErrorResponse(request.id,
                                 RpcError{kInvalidParams, "Tool name required", std::nullopt});
    }
    auto tool_name = name_it->get<std::string>();

    // Non-object arguments are treated as no arguments.
    auto arguments = nlohmann::json::object();
    auto args_it = params.find("arguments");
    if (args_it != params.end() && args_it->is_object()) {
        arguments = *args_it;
    }

    auto outcome = registry_.Execute(tool_name, arguments);
    if (outcome.IsErr()) {
        return MakeErrorResponse(request.id, outcome.Error());
    }

    return MakeResultResponse(request.id, {{"content", outcome.Value().content}});
}

} // namespace favorite_colors
