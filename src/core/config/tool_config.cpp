#include "core/config/tool_config.hpp"

#include <charconv>
#include <fstream>
#include <system_error>

namespace snipexec::core::config {

using errors::ErrorCategory;
using errors::ExecError;
using nlohmann::json;

namespace {

constexpr std::uint32_t kMaxTimeoutSeconds = 24 * 60 * 60;

ExecError invalid_timeout(const std::string& detail) {
    return ExecError{ErrorCategory::Input, "Invalid timeout: " + detail,
                     "invalid_timeout",
                     "Provide a whole number of seconds between 1 and 86400."};
}

}  // namespace

errors::Result<std::uint32_t> parse_timeout_seconds(const std::string& text) {
    std::uint32_t seconds = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, seconds);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return invalid_timeout("'" + text + "'");
    }
    if (seconds == 0 || seconds > kMaxTimeoutSeconds) {
        return invalid_timeout(text + " is out of bounds");
    }
    return seconds;
}

errors::Result<ToolConfig> load_tool_config(const json& config) {
    if (config.is_null()) {
        return ToolConfig{};
    }
    if (!config.is_object()) {
        return ExecError{ErrorCategory::Input, "Tool config must be a JSON object.",
                         "invalid_config"};
    }

    ToolConfig out;

    if (config.contains("timeout")) {
        const auto& value = config.at("timeout");
        if (value.is_number_integer()) {
            const auto seconds = value.get<std::int64_t>();
            if (seconds <= 0 || seconds > kMaxTimeoutSeconds) {
                return invalid_timeout(std::to_string(seconds) + " is out of bounds");
            }
            out.timeout_s = static_cast<std::uint32_t>(seconds);
        } else if (value.is_string()) {
            auto parsed = parse_timeout_seconds(value.get<std::string>());
            if (errors::is_error(parsed)) {
                return errors::get_error(parsed);
            }
            out.timeout_s = errors::get_value(parsed);
        } else {
            return invalid_timeout("expected an integer, got " +
                                   std::string(value.type_name()));
        }
    }

    if (config.contains("interpreter")) {
        const auto& value = config.at("interpreter");
        if (!value.is_string() || value.get<std::string>().empty()) {
            return ExecError{ErrorCategory::Input,
                             "interpreter must be a non-empty string.",
                             "invalid_interpreter"};
        }
        out.interpreter = value.get<std::string>();
    }

    if (config.contains("temp_dir")) {
        const auto& value = config.at("temp_dir");
        if (!value.is_string()) {
            return ExecError{ErrorCategory::Input, "temp_dir must be a string.",
                             "invalid_temp_dir"};
        }
        const std::filesystem::path dir(value.get<std::string>());
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec) || ec) {
            return ExecError{ErrorCategory::Input,
                             "temp_dir is not a directory: " + dir.string(),
                             "invalid_temp_dir"};
        }
        out.temp_dir = dir;
    }

    return out;
}

errors::Result<ToolConfig> load_tool_config_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return ExecError{ErrorCategory::Input,
                         "Unable to open config file: " + path.string(),
                         "config_read_failed"};
    }

    const json parsed = json::parse(in, nullptr, false);
    if (parsed.is_discarded()) {
        return ExecError{ErrorCategory::Input,
                         "Config file is not valid JSON: " + path.string(),
                         "config_parse_failed"};
    }
    return load_tool_config(parsed);
}

}  // namespace snipexec::core::config
