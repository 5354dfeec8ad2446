#include "safepy/tool_schema.h"

namespace safepy {

nlohmann::json ToolSchema::ToJson() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& parameter : parameters) {
        properties[parameter.name] = {
            {"type", parameter.type},
            {"description", parameter.description}
        };
        if (parameter.required) {
            required.push_back(parameter.name);
        }
    }

    return {
        {"name", name},
        {"description", description},
        {"parameters", {
            {"type", "object"},
            {"properties", properties},
            {"required", required}
        }}
    };
}

const ToolParameter* ToolSchema::FindParameter(const std::string& parameter_name) const {
    for (const auto& parameter : parameters) {
        if (parameter.name == parameter_name) {
            return &parameter;
        }
    }
    return nullptr;
}

ToolSchema ToolSchema::ForSandbox() {
    ToolSchema schema;
    schema.name = "python";
    schema.description = "A python interpreter for safe run";
    schema.parameters.push_back({"code", "string", "The code to execute", true});
    return schema;
}

} // namespace safepy
