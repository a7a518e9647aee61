#include <gtest/gtest.h>

#include <string>

#include "server/LineFramer.hpp"

using LogStream::LineFramer;

TEST(LineFramerTest, SplitsLinesAcrossReads) {
    LineFramer framer(16, 1024);
    ASSERT_TRUE(framer.feed("svc-A\n{\"lev").ok());
    EXPECT_TRUE(framer.hasLine());
    EXPECT_EQ(framer.nextLine(), "svc-A");
    EXPECT_FALSE(framer.nextLine().has_value());
    EXPECT_EQ(framer.pending(), 5U);

    ASSERT_TRUE(framer.feed("el\":6}\nsecond\nthi").ok());
    EXPECT_EQ(framer.nextLine(), "{\"level\":6}");
    EXPECT_EQ(framer.nextLine(), "second");
    EXPECT_FALSE(framer.hasLine());
    EXPECT_EQ(framer.pending(), 3U);
}

TEST(LineFramerTest, StripsCarriageReturnAndKeepsEmptyLines) {
    LineFramer framer(16, 1024);
    ASSERT_TRUE(framer.feed("one\r\n\ntwo\n").ok());
    EXPECT_EQ(framer.nextLine(), "one");
    EXPECT_EQ(framer.nextLine(), "");
    EXPECT_EQ(framer.nextLine(), "two");
    EXPECT_EQ(framer.pending(), 0U);
}

TEST(LineFramerTest, LineAtTheLimitIsAccepted) {
    LineFramer framer(8, 10);
    ASSERT_TRUE(framer.feed(std::string(10, 'x') + "\n").ok());
    EXPECT_EQ(framer.nextLine(), std::string(10, 'x'));
}

TEST(LineFramerTest, OversizedLineIsRejected) {
    LineFramer framer(8, 10);
    ASSERT_TRUE(framer.feed("ok\n012345").ok());
    const auto status = framer.feed("6789A");
    EXPECT_EQ(status.code(), absl::StatusCode::kResourceExhausted);
    // Lines completed before the violation are still available.
    EXPECT_EQ(framer.nextLine(), "ok");
}

TEST(LineFramerTest, OversizedLineWithoutNewline) {
    LineFramer framer(8, 16);
    EXPECT_FALSE(framer.feed(std::string(17, 'y')).ok());
    EXPECT_EQ(framer.maxLineLength(), 16U);
}
