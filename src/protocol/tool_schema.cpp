#include "protocol/tool_schema.hpp"

namespace snipexec::protocol {

using nlohmann::json;

json to_json(const FunctionToolSchema& schema) {
    json function;
    function["name"] = schema.name;
    function["description"] = schema.description;
    function["parameters"] = schema.parameters;

    json payload;
    payload["type"] = "function";
    payload["function"] = function;
    return payload;
}

FunctionToolSchema default_tool_schema() {
    FunctionToolSchema schema;
    schema.name = "python_interpreter";
    schema.description =
        "Run a Python snippet in a fresh interpreter process and return its "
        "stdout and stderr. A trailing bare expression is printed automatically.";

    json code;
    code["type"] = "string";
    code["description"] = "The Python code to execute.";

    schema.parameters["type"] = "object";
    schema.parameters["properties"]["code"] = code;
    schema.parameters["required"] = json::array({"code"});
    return schema;
}

}  // namespace snipexec::protocol
