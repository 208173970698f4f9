#include <gtest/gtest.h>
#include <transport/line_splitter.hpp>

TEST(LineSplitterTest, SplitsOnNewline) {
    LineSplitter s;
    auto lines = s.feed("one\ntwo\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(s.pending_bytes(), 0u);
}

TEST(LineSplitterTest, HoldsPartialLine) {
    LineSplitter s;
    EXPECT_TRUE(s.feed("Uploading a.t").empty());
    EXPECT_GT(s.pending_bytes(), 0u);
    auto lines = s.feed("xt to /tmp/a.txt\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "Uploading a.txt to /tmp/a.txt");
}

TEST(LineSplitterTest, CarriageReturnsAndBlankLines) {
    LineSplitter s;
    auto lines = s.feed("a\r\n\r\n   \nb\rc\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "c");
}

TEST(LineSplitterTest, TrimsLines) {
    LineSplitter s;
    auto lines = s.feed("   sftp> pwd  \t\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "sftp> pwd");
}

TEST(LineSplitterTest, FlushReturnsTail) {
    LineSplitter s;
    s.feed("sftp>");
    auto tail = s.flush();
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(*tail, "sftp>");
    EXPECT_FALSE(s.flush().has_value());
}
