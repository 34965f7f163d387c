#pragma once

#include <favorite_colors/core/result.hpp>
#include <favorite_colors/mcp/jsonrpc.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace favorite_colors {

// ---------------------------------------------------------------------------
// ToolSchema: what tools/list reports for one tool.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult: successful tool output, an array of content blocks.
// ---------------------------------------------------------------------------
struct ToolResult {
    nlohmann::json content = nlohmann::json::array();
};

// A handler either produces content or rejects its arguments with a
// JSON-RPC error (e.g. a missing required parameter).
using ToolOutcome = Result<ToolResult, RpcError>;
using ToolHandler = std::function<ToolOutcome(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry: name-keyed tools, built once at startup and read-only after.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Re-registering a name replaces its schema and handler in place, so
    // listing order stays the order of first registration.
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    // Unknown tools yield kMethodNotFound; a throwing handler yields
    // kInternalError carrying the exception text as data.
    [[nodiscard]] ToolOutcome Execute(const std::string& name,
                                      const nlohmann::json& arguments) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

/// A single text content block, the only content type these tools produce.
ToolResult MakeTextResult(const std::string& text);

} // namespace favorite_colors
