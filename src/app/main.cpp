#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/tool_config.hpp"
#include "core/errors/exec_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/tool_schema.hpp"
#include "tools/python_interpreter_tool.hpp"

namespace {

void report(const snipexec::core::errors::ExecError& err, const std::string& what) {
    LOG_ERROR(what + " (" + snipexec::core::errors::to_string(err.category) + ") [" +
              err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_WARN("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = snipexec::app::cli::parse_and_validate(argc, argv);
    if (snipexec::core::errors::is_error(parsed)) {
        report(snipexec::core::errors::get_error(parsed), "Input error");
        return 2;
    }
    const auto& req = snipexec::core::errors::get_value(parsed);
    if (req.verbose) {
        snipexec::core::logging::Logger::get().set_min_level(
            snipexec::core::logging::LogLevel::DEBUG);
    }

    if (req.command == snipexec::protocol::CliCommand::Schema) {
        std::cout << snipexec::protocol::to_json(snipexec::protocol::default_tool_schema()).dump(2)
                  << std::endl;
        return 0;
    }

    // 2. Configuration: file first, then flag overrides
    snipexec::core::config::ToolConfig config;
    if (req.config_file.has_value()) {
        auto loaded = snipexec::core::config::load_tool_config_file(req.config_file.value());
        if (snipexec::core::errors::is_error(loaded)) {
            report(snipexec::core::errors::get_error(loaded), "Config error");
            return 2;
        }
        config = snipexec::core::errors::get_value(loaded);
    }
    if (req.timeout_s.has_value()) {
        config.timeout_s = req.timeout_s.value();
    }
    if (req.interpreter.has_value()) {
        config.interpreter = req.interpreter.value();
    }

    std::string code;
    if (req.code.has_value()) {
        code = req.code.value();
    } else {
        std::ifstream in(req.code_file.value());
        if (!in.is_open()) {
            LOG_ERROR("Unable to open snippet file: " + req.code_file->string());
            return 2;
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        code = buffer.str();
    }

    // 3. One session, one execution
    snipexec::tools::PythonInterpreterTool tool(config);
    auto created = tool.create(req.session_id);
    if (snipexec::core::errors::is_error(created)) {
        report(snipexec::core::errors::get_error(created), "Failed to open session");
        return 3;
    }
    const std::string session_id = snipexec::core::errors::get_value(created);

    nlohmann::json parameters;
    parameters["code"] = code;
    const auto response = tool.execute(session_id, parameters);
    tool.release(session_id);

    std::cout << response.text << "\n"
              << "reward=" << response.reward << std::endl;
    return 0;
}
