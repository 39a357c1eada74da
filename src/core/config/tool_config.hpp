#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/exec_errors.hpp"

namespace snipexec::core::config {

struct ToolConfig {
    std::uint32_t timeout_s = 5;
    std::string interpreter = "python3";
    std::filesystem::path temp_dir;  // empty means the system temp directory
};

// Reads "timeout", "interpreter" and "temp_dir" from a JSON object. Missing
// keys keep their defaults, unknown keys are ignored.
errors::Result<ToolConfig> load_tool_config(const nlohmann::json& config);

errors::Result<ToolConfig> load_tool_config_file(const std::filesystem::path& path);

// Accepts "5" but not "5s", "-1" or "0".
errors::Result<std::uint32_t> parse_timeout_seconds(const std::string& text);

}  // namespace snipexec::core::config
