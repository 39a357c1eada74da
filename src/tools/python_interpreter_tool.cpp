#include "tools/python_interpreter_tool.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/tool_output.hpp"
#include "rewriter/print_rewriter.hpp"

namespace snipexec::tools {

using nlohmann::json;
using protocol::ToolResponse;

namespace {

runtime::RunnerOptions runner_options(const core::config::ToolConfig& config) {
    runtime::RunnerOptions options;
    options.interpreter = config.interpreter;
    options.temp_dir = config.temp_dir;
    return options;
}

// repr() of a str: single quotes unless only double quotes avoid escaping.
std::string python_string_repr(const std::string& text) {
    const bool has_single = text.find('\'') != std::string::npos;
    const bool has_double = text.find('"') != std::string::npos;
    const char quote = has_single && !has_double ? '"' : '\'';

    static const char kHex[] = "0123456789abcdef";
    std::string out(1, quote);
    for (const char c : text) {
        const auto u = static_cast<unsigned char>(c);
        if (c == quote || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (u < 0x20 || u == 0x7f) {
            out += "\\x";
            out.push_back(kHex[u >> 4]);
            out.push_back(kHex[u & 0x0f]);
        } else {
            out.push_back(c);
        }
    }
    out.push_back(quote);
    return out;
}

// str() of a JSON value as Python would see it after json.loads().
std::string python_str(const json& value, const bool nested) {
    switch (value.type()) {
        case json::value_t::null:
            return "None";
        case json::value_t::boolean:
            return value.get<bool>() ? "True" : "False";
        case json::value_t::string:
            return nested ? python_string_repr(value.get<std::string>())
                          : value.get<std::string>();
        case json::value_t::array: {
            std::string out = "[";
            for (std::size_t i = 0; i < value.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                out += python_str(value[i], true);
            }
            return out + "]";
        }
        case json::value_t::object: {
            std::string out = "{";
            bool first = true;
            for (const auto& item : value.items()) {
                if (!first) {
                    out += ", ";
                }
                first = false;
                out += python_string_repr(item.key()) + ": " + python_str(item.value(), true);
            }
            return out + "}";
        }
        default:
            return value.dump();
    }
}

}  // namespace

std::string code_argument(const json& parameters) {
    if (!parameters.is_object() || !parameters.contains("code")) {
        return "";
    }
    return python_str(parameters.at("code"), false);
}

PythonInterpreterTool::PythonInterpreterTool(core::config::ToolConfig config,
                                             protocol::FunctionToolSchema schema)
    : config_(std::move(config)),
      schema_(std::move(schema)),
      runner_(runner_options(config_)) {}

core::errors::Result<std::string> PythonInterpreterTool::create(
    const std::optional<std::string>& instance_id) {
    return sessions_.open(instance_id);
}

ToolResponse PythonInterpreterTool::execute(const std::string& instance_id,
                                            const json& parameters) const {
    // An unknown id is accepted: sessions carry no state the run needs yet.
    const auto session = sessions_.lookup(instance_id);
    if (core::errors::is_error(session)) {
        LOG_DEBUG("PythonInterpreterTool: " + core::errors::get_error(session).message +
                  ", running without session state");
    }

    const std::string code = rewriter::maybe_wrap_print(code_argument(parameters));
    const std::uint32_t timeout_ms = config_.timeout_s * 1000U;
    const auto result = runner_.run(code, timeout_ms);

    ToolResponse response;
    response.reward = protocol::reward_for(result);
    response.text = protocol::build_envelope(result.stdout_text, result.stderr_text);
    if (result.timed_out) {
        LOG_WARN("PythonInterpreterTool: session " + instance_id + " timed out after " +
                 std::to_string(config_.timeout_s) + "s");
    }
    return response;
}

double PythonInterpreterTool::calc_reward(const std::string& /*instance_id*/) const {
    return protocol::kNeutralReward;
}

void PythonInterpreterTool::release(const std::string& instance_id) {
    static_cast<void>(sessions_.close(instance_id));
}

}  // namespace snipexec::tools
