#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace snipexec::protocol {

    // What one snippet run produced, both streams already trimmed.
    struct ExecutionResult {
        std::string stdout_text;
        std::string stderr_text;
        bool timed_out = false;
    };

    // How the tool replies to its caller
    struct ToolResponse {
        std::string text;       // <tool_output>{...}</tool_output>, length capped
        double reward = 0.0;    // -0.1 when stderr was non-empty, else 0.0
        nlohmann::json metadata = nlohmann::json::object();
    };

    constexpr double kErrorReward = -0.1;
    constexpr double kNeutralReward = 0.0;

    // The reward only looks at stderr; stdout and the exit code never count.
    inline double reward_for(const ExecutionResult& result) {
        return result.stderr_text.empty() ? kNeutralReward : kErrorReward;
    }

} // namespace snipexec::protocol
