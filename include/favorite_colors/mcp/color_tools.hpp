#pragma once

#include <favorite_colors/mcp/tool_registry.hpp>
#include <favorite_colors/store/color_store.hpp>

namespace favorite_colors {

// Register add_color, get_colors, remove_color and clear_colors.
// Handlers capture &store by reference; the store must outlive the registry.
void RegisterColorTools(ToolRegistry& registry, ColorStore& store);

} // namespace favorite_colors
