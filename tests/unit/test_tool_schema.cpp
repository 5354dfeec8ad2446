#include <catch2/catch_test_macros.hpp>
#include <safepy/sandbox.h>
#include <safepy/tool_schema.h>

using namespace safepy;

TEST_CASE("Sandbox tool schema", "[tool_schema]") {
    ToolSchema schema = ToolSchema::ForSandbox();

    REQUIRE(schema.name == "python");
    REQUIRE(schema.description == "A python interpreter for safe run");
    REQUIRE(schema.parameters.size() == 1);

    const ToolParameter* code = schema.FindParameter("code");
    REQUIRE(code != nullptr);
    REQUIRE(code->type == "string");
    REQUIRE(code->required);
    REQUIRE(schema.FindParameter("timeout") == nullptr);
}

TEST_CASE("Tool schema JSON shape", "[tool_schema]") {
    nlohmann::json json = ToolSchema::ForSandbox().ToJson();

    REQUIRE(json["name"] == "python");
    REQUIRE(json["description"] == "A python interpreter for safe run");

    const nlohmann::json& parameters = json["parameters"];
    REQUIRE(parameters["type"] == "object");
    REQUIRE(parameters["required"] == nlohmann::json::array({"code"}));
    REQUIRE(parameters["properties"]["code"]["type"] == "string");
    REQUIRE(parameters["properties"]["code"]["description"] == "The code to execute");

    // Only type and description per property
    REQUIRE(parameters["properties"]["code"].size() == 2);
    REQUIRE_FALSE(parameters["properties"]["code"].contains("title"));
}

TEST_CASE("Optional parameters are left out of required", "[tool_schema]") {
    ToolSchema schema;
    schema.name = "custom";
    schema.parameters.push_back({"code", "string", "Source", true});
    schema.parameters.push_back({"label", "string", "Tag for the run", false});

    nlohmann::json json = schema.ToJson();
    REQUIRE(json["parameters"]["properties"].size() == 2);
    REQUIRE(json["parameters"]["required"].size() == 1);
    REQUIRE(json["parameters"]["required"][0] == "code");
}

TEST_CASE("Sandbox exposes its schema", "[tool_schema][sandbox]") {
    Sandbox sandbox;
    REQUIRE(sandbox.GetToolSchema().ToJson() == ToolSchema::ForSandbox().ToJson());
}
