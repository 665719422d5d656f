#include <gtest/gtest.h>
#include <cli/shell_escape.hpp>
#include <cstring>

static std::string feed(ShellEscape& e, const char* text) {
    return e.filter(text, static_cast<int>(std::strlen(text)));
}

TEST(ShellEscape, PlainInputPassesThrough) {
    ShellEscape e;
    EXPECT_EQ(feed(e, "ls -la\r"), "ls -la\r");
    EXPECT_FALSE(e.leave());
}

TEST(ShellEscape, TildeDotAtLineStartLeaves) {
    ShellEscape e;
    EXPECT_EQ(feed(e, "pwd\r~.ignored"), "pwd\r");
    EXPECT_TRUE(e.leave());
}

TEST(ShellEscape, DoubleTildeSendsOne) {
    ShellEscape e;
    EXPECT_EQ(feed(e, "~~"), "~");
    // The literal ~ is not at line start any more
    EXPECT_EQ(feed(e, "."), ".");
    EXPECT_FALSE(e.leave());
}

TEST(ShellEscape, TildeBeforeOtherCharSendsBoth) {
    ShellEscape e;
    EXPECT_EQ(feed(e, "~/bin\r"), "~/bin\r");
}

TEST(ShellEscape, TildeMidLineIsLiteral) {
    ShellEscape e;
    EXPECT_EQ(feed(e, "cd ~.\r"), "cd ~.\r");
    EXPECT_FALSE(e.leave());
}

TEST(ShellEscape, EscapeSplitAcrossReads) {
    ShellEscape e;
    EXPECT_EQ(feed(e, "echo\n~"), "echo\n");
    EXPECT_EQ(feed(e, "."), "");
    EXPECT_TRUE(e.leave());
}
