#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "rewriter/print_rewriter.hpp"

namespace {

using snipexec::rewriter::logical_lines;
using snipexec::rewriter::maybe_wrap_print;

TEST(PrintRewriterTest, WrapsTrailingExpression) {
    EXPECT_EQ(maybe_wrap_print("1 + 1"), "1 + 1\nprint(1 + 1)");
}

TEST(PrintRewriterTest, WrapsNameAfterAssignment) {
    EXPECT_EQ(maybe_wrap_print("x = 1\nx"), "x = 1\nx\nprint(x)");
}

TEST(PrintRewriterTest, TreatsSemicolonsAsLineBreaks) {
    EXPECT_EQ(maybe_wrap_print("x = 2; x * 3"), "x = 2; x * 3\nprint(x * 3)");
}

TEST(PrintRewriterTest, LeavesExplicitPrintAlone) {
    const std::string code = "value = 3\nprint(value)\nvalue";
    EXPECT_EQ(maybe_wrap_print(code), code);
}

TEST(PrintRewriterTest, LeavesTrailingAssignmentAlone) {
    EXPECT_EQ(maybe_wrap_print("a = 1\nb = a + 1"), "a = 1\nb = a + 1");
    EXPECT_EQ(maybe_wrap_print("x = 1; y = 2"), "x = 1; y = 2");
}

TEST(PrintRewriterTest, EqualsInsideNestedSyntaxStillBlocksWrapping) {
    EXPECT_EQ(maybe_wrap_print("dict(a=1)"), "dict(a=1)");
    EXPECT_EQ(maybe_wrap_print("1 == 1"), "1 == 1");
}

TEST(PrintRewriterTest, LeavesStatementsAlone) {
    const std::string loop = "for i in range(3):\n    i";
    EXPECT_EQ(maybe_wrap_print(loop), loop);
    EXPECT_EQ(maybe_wrap_print("raise ValueError('boom')"), "raise ValueError('boom')");
    EXPECT_EQ(maybe_wrap_print("import os"), "import os");
}

TEST(PrintRewriterTest, LeavesBlankSnippetAlone) {
    EXPECT_EQ(maybe_wrap_print(""), "");
    EXPECT_EQ(maybe_wrap_print("  \n ; \n"), "  \n ; \n");
}

TEST(PrintRewriterTest, DedentsAndStripsTrailingBlankLines) {
    EXPECT_EQ(maybe_wrap_print("    y = 4\n    y\n\n\n"), "y = 4\ny\nprint(y)");
}

TEST(PrintRewriterTest, IsIdempotentOnceWrapped) {
    const std::string once = maybe_wrap_print("2 ** 10");
    EXPECT_EQ(maybe_wrap_print(once), once);
}

TEST(PrintRewriterTest, LogicalLinesDropsBlankPieces) {
    const std::vector<std::string> expected = {"a = 1", "b", "c"};
    EXPECT_EQ(logical_lines("  a = 1 ;\n\n b;c  \n"), expected);
}

TEST(PrintRewriterTest, LeavesDeeplyNestedLastLineAlone) {
    const std::string code =
        "x = 1\n" + std::string(5000, '(') + "1" + std::string(5000, ')');
    EXPECT_EQ(maybe_wrap_print(code), code);

    const std::string unclosed(50000, '[');
    EXPECT_EQ(maybe_wrap_print(unclosed), unclosed);
}

}  // namespace
