#pragma once

#include <favorite_colors/mcp/jsonrpc.hpp>
#include <favorite_colors/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace favorite_colors {

constexpr const char* kMcpProtocolVersion = "2024-11-05";

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 request dispatcher.
//
// Methods:
//   - initialize
//   - tools/list
//   - tools/call  (then routed by tool name through the registry)
//
// Dispatch keeps no per-session state, so one instance can serve the stdio
// loop or many HTTP worker threads at once.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Stdio transport: one request per line until EOF on the input stream.
    // Empty lines are skipped. Lines that fail to decode are logged and
    // produce no output.
    void Run();

    // Decode and dispatch one message. Returns nullopt when the message is
    // not a request envelope.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message) const;

    // Dispatch a decoded request. Always yields a response envelope.
    [[nodiscard]] nlohmann::json HandleRequest(const JsonRpcRequest& request) const;

private:
    nlohmann::json HandleInitialize(const JsonRpcRequest& request) const;
    nlohmann::json HandleToolsList(const JsonRpcRequest& request) const;
    nlohmann::json HandleToolsCall(const JsonRpcRequest& request) const;

    ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace favorite_colors
