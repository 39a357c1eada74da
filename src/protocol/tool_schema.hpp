#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace snipexec::protocol {

// Function-tool descriptor an upstream caller uses to decide when to call us.
struct FunctionToolSchema {
    std::string name;
    std::string description;
    nlohmann::json parameters = nlohmann::json::object();
};

// {"type": "function", "function": {"name", "description", "parameters"}}
nlohmann::json to_json(const FunctionToolSchema& schema);

FunctionToolSchema default_tool_schema();

}  // namespace snipexec::protocol
