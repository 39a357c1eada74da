#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "core/config/tool_config.hpp"

namespace {

using nlohmann::json;
using snipexec::core::config::load_tool_config;
using snipexec::core::config::load_tool_config_file;
using snipexec::core::config::parse_timeout_seconds;
using snipexec::core::errors::get_error;
using snipexec::core::errors::get_value;
using snipexec::core::errors::is_error;

TEST(ToolConfigTest, DefaultsWhenKeysMissing) {
    auto result = load_tool_config(json::object());
    ASSERT_FALSE(is_error(result));
    const auto& config = get_value(result);
    EXPECT_EQ(config.timeout_s, 5u);
    EXPECT_EQ(config.interpreter, "python3");
    EXPECT_TRUE(config.temp_dir.empty());
}

TEST(ToolConfigTest, ReadsIntegerAndStringTimeouts) {
    auto from_int = load_tool_config(json{{"timeout", 12}});
    ASSERT_FALSE(is_error(from_int));
    EXPECT_EQ(get_value(from_int).timeout_s, 12u);

    auto from_string = load_tool_config(json{{"timeout", "7"}});
    ASSERT_FALSE(is_error(from_string));
    EXPECT_EQ(get_value(from_string).timeout_s, 7u);
}

TEST(ToolConfigTest, RejectsBadTimeouts) {
    for (const json& bad : {json(0), json(-3), json("5s"), json(1.5), json(true)}) {
        auto result = load_tool_config(json{{"timeout", bad}});
        ASSERT_TRUE(is_error(result)) << bad.dump();
        EXPECT_EQ(get_error(result).code, "invalid_timeout");
    }
}

TEST(ToolConfigTest, RejectsEmptyInterpreter) {
    auto result = load_tool_config(json{{"interpreter", ""}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_interpreter");
}

TEST(ToolConfigTest, RejectsMissingTempDir) {
    auto result = load_tool_config(json{{"temp_dir", "/definitely/not/here"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_temp_dir");
}

TEST(ToolConfigTest, RejectsNonObjectConfig) {
    auto result = load_tool_config(json::array({1, 2}));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_config");
}

TEST(ToolConfigTest, IgnoresUnknownKeys) {
    auto result = load_tool_config(json{{"timeout", 3}, {"type", "native"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).timeout_s, 3u);
}

TEST(ToolConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::current_path() /
                      (".tmp_tool_config_" + snipexec::core::config::generate_session_id() +
                       ".json");
    {
        std::ofstream out(path);
        out << R"({"timeout": 9, "interpreter": "python3"})";
    }

    auto result = load_tool_config_file(path);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).timeout_s, 9u);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(ToolConfigTest, ReportsMalformedFile) {
    const auto path = std::filesystem::current_path() /
                      (".tmp_tool_config_" + snipexec::core::config::generate_session_id() +
                       ".json");
    {
        std::ofstream out(path);
        out << "{not json";
    }

    auto result = load_tool_config_file(path);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_parse_failed");

    std::error_code ec;
    std::filesystem::remove(path, ec);

    auto missing = load_tool_config_file(path);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "config_read_failed");
}

TEST(ToolConfigTest, ParseTimeoutSeconds) {
    ASSERT_FALSE(is_error(parse_timeout_seconds("30")));
    EXPECT_EQ(get_value(parse_timeout_seconds("30")), 30u);
    EXPECT_TRUE(is_error(parse_timeout_seconds("")));
    EXPECT_TRUE(is_error(parse_timeout_seconds("0")));
    EXPECT_TRUE(is_error(parse_timeout_seconds("-1")));
    EXPECT_TRUE(is_error(parse_timeout_seconds("100000")));
}

}  // namespace
