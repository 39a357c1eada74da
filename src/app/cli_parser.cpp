#include "cli_parser.hpp"
#include <optional>
#include <system_error>
#include <vector>
#include "core/config/tool_config.hpp"

namespace snipexec::app::cli {

    using namespace snipexec::core::errors;
    using snipexec::protocol::CliCommand;
    using snipexec::protocol::CliRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> code;
        std::optional<std::string> file;
        std::optional<std::string> config;
        std::optional<std::string> timeout;
        std::optional<std::string> interpreter;
        std::optional<std::string> session;
        bool verbose = false;
    };

    namespace {

        constexpr const char* kUsage =
            "Usage: snipexec run (--code \"...\" | --file snippet.py) [--config tool.json] "
            "[--timeout SECONDS] [--interpreter python3] [--session ID] [--verbose]\n"
            "       snipexec schema";

        Result<std::filesystem::path> existing_file(const std::string& raw, const std::string& flag) {
            std::filesystem::path p(raw);
            std::error_code ec;
            const bool is_file = std::filesystem::is_regular_file(p, ec);
            if (ec || !is_file) {
                return ExecError{ErrorCategory::Input, flag + " does not name a readable file: " + raw, "invalid_path"};
            }
            return p;
        }

    } // namespace

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ExecError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        CliRequest req;
        if (command == "schema") {
            if (argc > 2) {
                return ExecError{ErrorCategory::Input, "Unknown argument: " + std::string(argv[2]), "unknown_argument", kUsage};
            }
            req.command = CliCommand::Schema;
            return req;
        }
        if (command != "run") {
            return ExecError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'run' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        auto read_value = [&args](size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            slot = args[++i];
            return true;
        };

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            bool ok = true;
            if (flag == "--code") {
                ok = read_value(i, raw.code);
            } else if (flag == "--file") {
                ok = read_value(i, raw.file);
            } else if (flag == "--config") {
                ok = read_value(i, raw.config);
            } else if (flag == "--timeout") {
                ok = read_value(i, raw.timeout);
            } else if (flag == "--interpreter") {
                ok = read_value(i, raw.interpreter);
            } else if (flag == "--session") {
                ok = read_value(i, raw.session);
            } else if (flag == "--verbose") {
                raw.verbose = true;
            } else {
                return ExecError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument", kUsage};
            }
            if (!ok) {
                return ExecError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.verbose = raw.verbose;

        // Mutual Exclusion XOR check
        if (!raw.code.has_value() && !raw.file.has_value()) {
            return ExecError{ErrorCategory::Input, "Must provide either --code or --file", "missing_required_flag", kUsage};
        }
        if (raw.code.has_value() && raw.file.has_value()) {
            return ExecError{ErrorCategory::Input, "Cannot provide both --code and --file", "conflicting_flags"};
        }

        if (raw.code) req.code = raw.code.value();
        if (raw.file) {
            auto path = existing_file(raw.file.value(), "--file");
            if (is_error(path)) return get_error(path);
            req.code_file = get_value(path);
        }
        if (raw.config) {
            auto path = existing_file(raw.config.value(), "--config");
            if (is_error(path)) return get_error(path);
            req.config_file = get_value(path);
        }

        if (raw.timeout) {
            auto seconds = snipexec::core::config::parse_timeout_seconds(raw.timeout.value());
            if (is_error(seconds)) return get_error(seconds);
            req.timeout_s = get_value(seconds);
        }

        if (raw.interpreter) {
            if (raw.interpreter->empty()) {
                return ExecError{ErrorCategory::Input, "--interpreter cannot be empty", "invalid_interpreter"};
            }
            req.interpreter = raw.interpreter.value();
        }

        if (raw.session) {
            if (raw.session->empty()) {
                return ExecError{ErrorCategory::Input, "--session cannot be empty", "invalid_session_id"};
            }
            req.session_id = raw.session.value();
        }

        return req;
    }

} // namespace snipexec::app::cli
