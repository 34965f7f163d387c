#include <favorite_colors/mcp/tool_registry.hpp>

#include <favorite_colors/core/log.hpp>

#include <algorithm>
#include <exception>

namespace favorite_colors {

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    auto it = std::find_if(schemas_.begin(), schemas_.end(),
                           [&name](const ToolSchema& s) { return s.name == name; });
    if (it != schemas_.end()) {
        *it = ToolSchema{name, description, input_schema};
    } else {
        schemas_.push_back({name, description, input_schema});
    }
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolOutcome ToolRegistry::Execute(const std::string& name,
                                  const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return ToolOutcome::Err(RpcError{kMethodNotFound, "Tool not found", std::nullopt});
    }

    try {
        return it->second(arguments);
    } catch (const std::exception& e) {
        LogError("tools", "Tool '" + name + "' failed: " + e.what());
        return ToolOutcome::Err(
            RpcError{kInternalError, "Internal error", nlohmann::json(e.what())});
    }
}

ToolResult MakeTextResult(const std::string& text) {
    return ToolResult{
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

} // namespace favorite_colors
