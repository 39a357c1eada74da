#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace snipexec::protocol {

    enum class CliCommand {
        Run,     // execute one snippet and print the envelope
        Schema   // print the tool schema
    };

    // Validated command-line input
    struct CliRequest {
        CliCommand command = CliCommand::Run;
        std::optional<std::string> code;
        std::optional<std::filesystem::path> code_file;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::uint32_t> timeout_s;     // overrides the config file
        std::optional<std::string> interpreter;     // overrides the config file
        std::optional<std::string> session_id;
        bool verbose = false;
    };

} // namespace snipexec::protocol
