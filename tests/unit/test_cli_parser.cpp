#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/exec_errors.hpp"

namespace {

using snipexec::app::cli::parse_and_validate;
using snipexec::core::errors::ErrorCategory;
using snipexec::core::errors::get_error;
using snipexec::core::errors::get_value;
using snipexec::core::errors::is_error;
using snipexec::protocol::CliCommand;
using snipexec::protocol::CliRequest;

snipexec::core::errors::Result<CliRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("snipexec");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, ParsesSchemaCommand) {
    auto result = parse_tokens({"schema"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command, CliCommand::Schema);
}

TEST(CliParserTest, FailsWhenCodeAndFileMissing) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenCodeAndFileBothProvided) {
    auto result = parse_tokens({"run", "--code", "1", "--file", "snippet.py"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_tokens({"run", "--code"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"run", "--code", "1", "--max-steps", "3"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenTimeoutNotNumeric) {
    auto result = parse_tokens({"run", "--code", "1", "--timeout", "5s"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_timeout");
}

TEST(CliParserTest, FailsWhenTimeoutZero) {
    auto result = parse_tokens({"run", "--code", "1", "--timeout", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_timeout");
}

TEST(CliParserTest, FailsWhenFileMissing) {
    const auto missing =
        std::filesystem::current_path() / "__definitely_missing_snippet__.py";
    auto result = parse_tokens({"run", "--file", missing.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ParsesValidCodeRequest) {
    auto result = parse_tokens({"run", "--code", "1 + 1", "--timeout", "3",
                                "--interpreter", "python3", "--session", "s-1",
                                "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::Run);
    ASSERT_TRUE(req.code.has_value());
    EXPECT_EQ(req.code.value(), "1 + 1");
    EXPECT_FALSE(req.code_file.has_value());
    ASSERT_TRUE(req.timeout_s.has_value());
    EXPECT_EQ(req.timeout_s.value(), 3u);
    EXPECT_EQ(req.interpreter.value_or(""), "python3");
    EXPECT_EQ(req.session_id.value_or(""), "s-1");
    EXPECT_TRUE(req.verbose);
}

TEST(CliParserTest, ParsesValidFileRequest) {
    const auto snippet = std::filesystem::current_path() /
                         (".tmp_cli_snippet_" +
                          snipexec::core::config::generate_session_id() + ".py");
    {
        std::ofstream out(snippet);
        out << "print(1)\n";
    }

    auto result = parse_tokens({"run", "--file", snippet.string()});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_FALSE(req.code.has_value());
    ASSERT_TRUE(req.code_file.has_value());
    EXPECT_EQ(req.code_file.value(), snippet);
    EXPECT_FALSE(req.timeout_s.has_value());
    EXPECT_FALSE(req.verbose);

    std::error_code ec;
    std::filesystem::remove(snippet, ec);
}

}  // namespace
