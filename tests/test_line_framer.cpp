/// @file test_line_framer.cpp
/// Unit tests for line_framer.hpp: splitting the stream body into lines.

#include "line_framer.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace stream_keeper;

static std::vector<std::string> feed(LineFramer& framer, const std::string& bytes) {
    return framer.feed(bytes.data(), bytes.size());
}

TEST(LineFramer, SplitsCrLfLines) {
    LineFramer framer;
    auto lines = feed(framer, "{\"a\":1}\r\n{\"b\":2}\r\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "{\"a\":1}");
    EXPECT_EQ(lines[1], "{\"b\":2}");
    EXPECT_EQ(framer.pendingBytes(), 0u);
}

TEST(LineFramer, KeepaliveBecomesEmptyLine) {
    LineFramer framer;
    auto lines = feed(framer, "\r\n\r\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "");
    EXPECT_EQ(lines[1], "");
}

TEST(LineFramer, ReassemblesAcrossFeeds) {
    LineFramer framer;
    EXPECT_TRUE(feed(framer, "{\"data\":{\"te").empty());
    EXPECT_EQ(framer.pendingBytes(), 12u);
    EXPECT_TRUE(feed(framer, "xt\":\"hi\"}}\r").empty());

    auto lines = feed(framer, "\n\r\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "{\"data\":{\"text\":\"hi\"}}");
    EXPECT_EQ(lines[1], "");
}

TEST(LineFramer, BareLfIsAlsoALineBreak) {
    LineFramer framer;
    auto lines = feed(framer, "one\ntwo\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
}

TEST(LineFramer, PartialTailIsHeldAndResetClearsIt) {
    LineFramer framer;
    auto lines = feed(framer, "done\r\npart");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(framer.pendingBytes(), 4u);

    framer.reset();
    EXPECT_EQ(framer.pendingBytes(), 0u);
    lines = feed(framer, "fresh\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "fresh");
}

TEST(LineFramer, UnterminatedTailBeyondLimitOverflows) {
    LineFramer framer(8);
    auto lines = feed(framer, "ok\nabcdefgh");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "ok");
    EXPECT_FALSE(framer.overflowed());
    EXPECT_EQ(framer.pendingBytes(), 8u);

    EXPECT_TRUE(feed(framer, "i").empty());
    EXPECT_TRUE(framer.overflowed());
    EXPECT_EQ(framer.pendingBytes(), 0u);

    // Nothing more is framed until reset.
    EXPECT_TRUE(feed(framer, "\nlate\n").empty());
    framer.reset();
    EXPECT_FALSE(framer.overflowed());
    lines = feed(framer, "again\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "again");
}

TEST(LineFramer, CompleteLinesLongerThanLimitAreNotAnOverflow) {
    LineFramer framer(4);
    auto lines = feed(framer, "0123456789\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "0123456789");
    EXPECT_FALSE(framer.overflowed());
}
