#include <catch2/catch_test_macros.hpp>

#include <favorite_colors/mcp/tool_registry.hpp>

#include <stdexcept>

using namespace favorite_colors;

namespace {

ToolHandler ReturnText(const std::string& text) {
    return [text](const nlohmann::json&) {
        return ToolOutcome::Ok(MakeTextResult(text));
    };
}

} // anonymous namespace

TEST_CASE("ToolRegistry: register and list tools", "[mcp][registry]") {
    ToolRegistry registry;

    nlohmann::json schema = {
        {"type", "object"},
        {"properties", {
            {"color", {{"type", "string"}}}
        }},
        {"required", nlohmann::json::array({"color"})}
    };

    registry.Register("paint", "Paint something", schema, ReturnText("done"));

    REQUIRE(registry.Tools().size() == 1);
    CHECK(registry.Tools()[0].name == "paint");
    CHECK(registry.Tools()[0].description == "Paint something");
    CHECK(registry.Tools()[0].input_schema["required"][0] == "color");
}

TEST_CASE("ToolRegistry: execute passes arguments to handler", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("echo", "Echo input", nlohmann::json::object(),
        [](const nlohmann::json& arguments) {
            return ToolOutcome::Ok(MakeTextResult(arguments.value("msg", "")));
        });

    auto outcome = registry.Execute("echo", {{"msg", "hello"}});
    REQUIRE(outcome.IsOk());
    REQUIRE(outcome.Value().content.size() == 1);
    CHECK(outcome.Value().content[0]["type"] == "text");
    CHECK(outcome.Value().content[0]["text"] == "hello");
}

TEST_CASE("ToolRegistry: execute unknown tool is method-not-found", "[mcp][registry]") {
    ToolRegistry registry;

    auto outcome = registry.Execute("nonexistent", nlohmann::json::object());
    REQUIRE(outcome.IsErr());
    CHECK(outcome.Error().code == kMethodNotFound);
    CHECK(outcome.Error().message == "Tool not found");
}

TEST_CASE("ToolRegistry: handler errors pass through", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("strict", "Rejects everything", nlohmann::json::object(),
        [](const nlohmann::json&) {
            return ToolOutcome::Err(RpcError{kInvalidParams, "nope", std::nullopt});
        });

    auto outcome = registry.Execute("strict", nlohmann::json::object());
    REQUIRE(outcome.IsErr());
    CHECK(outcome.Error().code == kInvalidParams);
}

TEST_CASE("ToolRegistry: handler exception becomes internal error", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("throw", "Throws", nlohmann::json::object(),
        [](const nlohmann::json&) -> ToolOutcome {
            throw std::runtime_error("boom");
        });

    auto outcome = registry.Execute("throw", nlohmann::json::object());
    REQUIRE(outcome.IsErr());
    CHECK(outcome.Error().code == kInternalError);
    REQUIRE(outcome.Error().data.has_value());
    CHECK(outcome.Error().data->get<std::string>() == "boom");
}

TEST_CASE("ToolRegistry: HasTool", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("foo", "Foo tool", nlohmann::json::object(), ReturnText("foo"));

    CHECK(registry.HasTool("foo"));
    CHECK_FALSE(registry.HasTool("bar"));
}

TEST_CASE("ToolRegistry: re-registration replaces in place", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("a", "first A", nlohmann::json::object(), ReturnText("A1"));
    registry.Register("b", "Tool B", nlohmann::json::object(), ReturnText("B"));
    registry.Register("a", "second A", nlohmann::json::object(), ReturnText("A2"));

    REQUIRE(registry.Tools().size() == 2);
    CHECK(registry.Tools()[0].name == "a");
    CHECK(registry.Tools()[0].description == "second A");
    CHECK(registry.Tools()[1].name == "b");
    CHECK(registry.Execute("a", {}).Value().content[0]["text"] == "A2");
}
