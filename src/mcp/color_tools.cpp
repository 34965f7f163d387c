#include <favorite_colors/mcp/color_tools.hpp>

#include <favorite_colors/core/log.hpp>

#include <optional>
#include <string>

namespace favorite_colors {

namespace {

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

// A required non-empty string argument. Absent, empty and non-string values
// are all rejected the same way.
std::optional<std::string> RequireString(const nlohmann::json& arguments,
                                         const std::string& key) {
    if (!arguments.is_object()) {
        return std::nullopt;
    }
    auto it = arguments.find(key);
    if (it == arguments.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

ToolOutcome ColorRequired() {
    return ToolOutcome::Err(
        RpcError{kInvalidParams, "Color parameter required", std::nullopt});
}

// ---------------------------------------------------------------------------
// Schemas
// ---------------------------------------------------------------------------

nlohmann::json ColorArgumentSchema(const std::string& description) {
    return {
        {"type", "object"},
        {"properties", {
            {"color", {{"type", "string"}, {"description", description}}}
        }},
        {"required", nlohmann::json::array({"color"})}
    };
}

nlohmann::json NoArgumentSchema() {
    return {{"type", "object"}};
}

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------

ToolOutcome HandleAddColor(ColorStore& store, const nlohmann::json& arguments) {
    auto color = RequireString(arguments, "color");
    if (!color) {
        return ColorRequired();
    }
    auto outcome = store.Add(*color);
    LogDebug("tools", "add_color '" + *color + "' added=" +
                          (outcome.added ? "true" : "false"));
    return ToolOutcome::Ok(MakeTextResult(outcome.message));
}

ToolOutcome HandleGetColors(const ColorStore& store) {
    return ToolOutcome::Ok(MakeTextResult(store.Get().text));
}

ToolOutcome HandleRemoveColor(ColorStore& store, const nlohmann::json& arguments) {
    auto color = RequireString(arguments, "color");
    if (!color) {
        return ColorRequired();
    }
    auto outcome = store.Remove(*color);
    LogDebug("tools", "remove_color '" + *color + "' removed=" +
                          (outcome.removed ? "true" : "false"));
    return ToolOutcome::Ok(MakeTextResult(outcome.message));
}

ToolOutcome HandleClearColors(ColorStore& store) {
    auto outcome = store.Clear();
    LogDebug("tools", "clear_colors removed " +
                          std::to_string(outcome.previous_count));
    return ToolOutcome::Ok(MakeTextResult(outcome.message));
}

} // anonymous namespace

void RegisterColorTools(ToolRegistry& registry, ColorStore& store) {
    registry.Register(
        "add_color",
        "Add a color to your favorites list",
        ColorArgumentSchema("The color to add to favorites"),
        [&store](const nlohmann::json& arguments) {
            return HandleAddColor(store, arguments);
        });

    registry.Register(
        "get_colors",
        "Get all favorite colors",
        NoArgumentSchema(),
        [&store](const nlohmann::json&) {
            return HandleGetColors(store);
        });

    registry.Register(
        "remove_color",
        "Remove a color from your favorites list",
        ColorArgumentSchema("The color to remove from favorites"),
        [&store](const nlohmann::json& arguments) {
            return HandleRemoveColor(store, arguments);
        });

    registry.Register(
        "clear_colors",
        "Clear all favorite colors",
        NoArgumentSchema(),
        [&store](const nlohmann::json&) {
            return HandleClearColors(store);
        });
}

} // namespace favorite_colors
