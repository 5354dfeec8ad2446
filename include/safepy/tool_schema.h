#pragma once

#include "api_export.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace safepy {

struct ToolParameter {
    std::string name;
    std::string type;          // JSON Schema type, e.g. "string"
    std::string description;
    bool required = true;
};

/**
 * ToolSchema - how the sandbox is advertised to a function-calling LLM
 *
 * ToJson() produces an OpenAI-style function object:
 *   {"name": ..., "description": ...,
 *    "parameters": {"type": "object", "properties": {...}, "required": [...]}}
 */
struct SAFEPY_API ToolSchema {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;

    nlohmann::json ToJson() const;

    const ToolParameter* FindParameter(const std::string& parameter_name) const;

    // The single "code" parameter accepted by Sandbox::Execute
    static ToolSchema ForSandbox();
};

} // namespace safepy
