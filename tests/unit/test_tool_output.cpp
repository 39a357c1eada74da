#include <string>
#include <gtest/gtest.h>
#include "protocol/tool_contract.hpp"
#include "protocol/tool_output.hpp"
#include "protocol/tool_schema.hpp"

namespace {

using snipexec::protocol::build_envelope;
using snipexec::protocol::ExecutionResult;
using snipexec::protocol::kMaxEnvelopeChars;
using snipexec::protocol::reward_for;
using snipexec::protocol::serialize_streams;

TEST(ToolOutputTest, EnvelopeHasLiteralShape) {
    EXPECT_EQ(build_envelope("2", ""),
              "<tool_output>{\"stdout\": \"2\", \"stderr\": \"\"}</tool_output>");
}

TEST(ToolOutputTest, EscapesControlCharactersAndQuotes) {
    EXPECT_EQ(serialize_streams("a\nb\t\"c\"", "back\\slash"),
              "{\"stdout\": \"a\\nb\\t\\\"c\\\"\", \"stderr\": \"back\\\\slash\"}");
}

TEST(ToolOutputTest, EscapesNonAsciiAsUnicodeEscapes) {
    EXPECT_EQ(serialize_streams("caf\xC3\xA9", ""),
              "{\"stdout\": \"caf\\u00e9\", \"stderr\": \"\"}");
}

TEST(ToolOutputTest, InvalidUtf8DoesNotThrow) {
    std::string payload;
    EXPECT_NO_THROW(payload = serialize_streams("bad \xFF byte", ""));
    EXPECT_NE(payload.find("\\ufffd"), std::string::npos);
}

TEST(ToolOutputTest, EnvelopeIsCappedForHugeOutput) {
    const std::string huge(10000, 'x');
    const std::string envelope = build_envelope(huge, huge);
    EXPECT_EQ(envelope.size(), kMaxEnvelopeChars);
    EXPECT_EQ(envelope.rfind("<tool_output>{\"stdout\": \"xxx", 0), 0u);
    EXPECT_EQ(envelope.find("</tool_output>"), std::string::npos);
}

TEST(ToolOutputTest, RewardOnlyDependsOnStderr) {
    ExecutionResult ok{"lots of output", "", false};
    ExecutionResult failed{"", "Traceback", false};
    ExecutionResult printed_and_failed{"partial", "boom", false};
    EXPECT_DOUBLE_EQ(reward_for(ok), 0.0);
    EXPECT_DOUBLE_EQ(reward_for(failed), -0.1);
    EXPECT_DOUBLE_EQ(reward_for(printed_and_failed), -0.1);
}

TEST(ToolSchemaTest, DefaultSchemaRequiresCode) {
    const auto schema = snipexec::protocol::to_json(snipexec::protocol::default_tool_schema());
    EXPECT_EQ(schema["type"], "function");
    EXPECT_EQ(schema["function"]["name"], "python_interpreter");
    EXPECT_EQ(schema["function"]["parameters"]["properties"]["code"]["type"], "string");
    EXPECT_EQ(schema["function"]["parameters"]["required"][0], "code");
}

}  // namespace
