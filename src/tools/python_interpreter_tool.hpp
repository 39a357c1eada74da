#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/tool_config.hpp"
#include "core/errors/exec_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/tool_schema.hpp"
#include "runtime/snippet_runner.hpp"
#include "session/session_registry.hpp"

namespace snipexec::tools {

// The single entry point callers use: create a session, execute snippets in
// it, release it. execute() rewrites the snippet, runs it in a fresh process
// and returns the capped <tool_output> envelope with a reward of -0.1 when
// stderr was non-empty and 0.0 otherwise.
//
// create/execute/release may be called concurrently from different threads.
class PythonInterpreterTool {
public:
    explicit PythonInterpreterTool(
        core::config::ToolConfig config = {},
        protocol::FunctionToolSchema schema = protocol::default_tool_schema());

    const protocol::FunctionToolSchema& tool_schema() const { return schema_; }
    const core::config::ToolConfig& config() const { return config_; }

    core::errors::Result<std::string> create(
        const std::optional<std::string>& instance_id = std::nullopt);

    // `parameters` is the call's JSON arguments; only "code" is read.
    protocol::ToolResponse execute(const std::string& instance_id,
                                   const nlohmann::json& parameters) const;

    // Per-step rewards come from execute(); there is no episode-level reward.
    double calc_reward(const std::string& instance_id) const;

    void release(const std::string& instance_id);

    std::size_t live_sessions() const { return sessions_.session_count(); }

private:
    core::config::ToolConfig config_;
    protocol::FunctionToolSchema schema_;
    runtime::SnippetRunner runner_;
    session::SessionRegistry sessions_;
};

// Python str() of the "code" argument: strings as is, missing -> "",
// null -> "None", booleans -> "True"/"False", lists and dicts in their
// Python repr form. Numbers keep their JSON spelling and dict keys come out
// sorted, since the parsed JSON no longer carries insertion order.
std::string code_argument(const nlohmann::json& parameters);

}  // namespace snipexec::tools
