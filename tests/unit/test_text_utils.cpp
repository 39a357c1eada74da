#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/text/text_utils.hpp"

namespace {

using snipexec::core::text::dedent;
using snipexec::core::text::rstrip;
using snipexec::core::text::split_lines;
using snipexec::core::text::strip;

TEST(TextUtilsTest, StripRemovesSurroundingWhitespace) {
    EXPECT_EQ(strip("  \n\tvalue \r\n"), "value");
    EXPECT_EQ(strip("   "), "");
    EXPECT_EQ(strip(""), "");
    EXPECT_EQ(strip("a b"), "a b");
}

TEST(TextUtilsTest, RstripKeepsLeadingWhitespace) {
    EXPECT_EQ(rstrip("  x = 1\n\n  \n"), "  x = 1");
}

TEST(TextUtilsTest, SplitLinesKeepsEmptyPieces) {
    const std::vector<std::string> expected = {"a", "", "b", ""};
    EXPECT_EQ(split_lines("a\n\nb\n"), expected);
}

TEST(TextUtilsTest, DedentRemovesCommonIndent) {
    EXPECT_EQ(dedent("    x = 1\n    if x:\n        y = 2\n"),
              "x = 1\nif x:\n    y = 2\n");
}

TEST(TextUtilsTest, DedentIgnoresBlankLinesForMargin) {
    EXPECT_EQ(dedent("  a\n\n      \n  b"), "a\n\n\nb");
}

TEST(TextUtilsTest, DedentLeavesMixedMarginAlone) {
    EXPECT_EQ(dedent("  a\n\tb"), "  a\n\tb");
    EXPECT_EQ(dedent("a\n  b"), "a\n  b");
}

}  // namespace
