#include "text_buffer.h"

#include <string>

#include "gtest/gtest.h"

namespace {

TextBuffer filled(size_t length) {
  TextBuffer buffer;
  buffer.append(std::string(length, 'x'), false);
  return buffer;
}

}  // namespace

TEST(TextBufferTest, AppendMovesCursorOnlyWhenAsked) {
  TextBuffer buffer;
  buffer.append("hello\n", true);
  EXPECT_EQ(6u, buffer.cursor());

  buffer.set_cursor(2);
  buffer.append("world\n", false);
  EXPECT_EQ(2u, buffer.cursor());
  EXPECT_EQ("hello\nworld\n", buffer.text());
}

TEST(TextBufferTest, SetCursorClampsToLength) {
  TextBuffer buffer;
  buffer.append("abc", false);
  buffer.set_cursor(100);
  EXPECT_EQ(3u, buffer.cursor());
}

TEST(TextBufferTest, SetTextKeepsCursorInRange) {
  TextBuffer buffer;
  buffer.append("0123456789", true);
  buffer.set_text("abc");
  EXPECT_EQ(3u, buffer.cursor());
}

TEST(TextBufferTest, SplitsLinesAndLocatesCursorLine) {
  TextBuffer buffer;
  buffer.append("one\ntwo\nthree\n", true);

  auto lines = buffer.lines();
  ASSERT_EQ(3u, lines.size());
  EXPECT_EQ("three", lines[2]);
  EXPECT_EQ(2u, buffer.cursor_line());

  buffer.set_cursor(5);
  EXPECT_EQ(1u, buffer.cursor_line());
  buffer.set_cursor(0);
  EXPECT_EQ(0u, buffer.cursor_line());
}

TEST(TextBufferTest, CapacityDropsWholeLinesFromFront) {
  TextBuffer buffer(10);
  buffer.append("aaaa\nbbbb\n", true);
  buffer.append("cccc\n", true);

  EXPECT_EQ("bbbb\ncccc\n", buffer.text());
  EXPECT_EQ(buffer.size(), buffer.cursor());
}

TEST(ScrollBufferTest, ScrollUpAlwaysDisablesFollow) {
  TextBuffer buffer = filled(1000);
  buffer.move_cursor_to_end();

  EXPECT_FALSE(scroll_buffer(buffer, ScrollDirection::Up, 2, true));
  EXPECT_EQ(1000u - 2 * ASSUMED_LINE_WIDTH, buffer.cursor());
}

TEST(ScrollBufferTest, ScrollUpStopsAtStart) {
  TextBuffer buffer = filled(100);
  buffer.set_cursor(50);
  scroll_buffer(buffer, ScrollDirection::Up, 5, false);
  EXPECT_EQ(0u, buffer.cursor());
}

TEST(ScrollBufferTest, ScrollDownResumesFollowWithinThreshold) {
  TextBuffer buffer = filled(1000);

  // lands on 990 == L - 10
  buffer.set_cursor(910);
  EXPECT_TRUE(scroll_buffer(buffer, ScrollDirection::Down, 1, false));
  EXPECT_EQ(990u, buffer.cursor());
}

TEST(ScrollBufferTest, ScrollDownShortOfThresholdKeepsFollowOff) {
  TextBuffer buffer = filled(1000);

  // lands on 989 == L - 11
  buffer.set_cursor(909);
  EXPECT_FALSE(scroll_buffer(buffer, ScrollDirection::Down, 1, false));
  EXPECT_EQ(989u, buffer.cursor());
}

TEST(ScrollBufferTest, ScrollDownClampsAtEnd) {
  TextBuffer buffer = filled(100);
  buffer.set_cursor(0);
  EXPECT_TRUE(scroll_buffer(buffer, ScrollDirection::Down, 10, false));
  EXPECT_EQ(100u, buffer.cursor());
}

TEST(ScrollBufferTest, ShortBufferResumesFollowImmediately) {
  TextBuffer buffer = filled(5);
  buffer.set_cursor(0);
  EXPECT_TRUE(scroll_buffer(buffer, ScrollDirection::Down, 1, false));
}
