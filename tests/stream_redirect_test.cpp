#include "stream_redirect.h"

#include <iostream>
#include <sstream>

#include "gtest/gtest.h"

namespace {

class LogStreamBufferTest : public ::testing::Test {
 protected:
  void SetUp() override { LogStreamBuffer::clear_messages(); }
  void TearDown() override { LogStreamBuffer::clear_messages(); }

  std::ofstream closed_file_;
};

}  // namespace

TEST_F(LogStreamBufferTest, SplitsFlushedTextIntoTaggedLines) {
  LogStreamBuffer buffer("[Msg] ", closed_file_);
  std::ostream out(&buffer);
  out << "first\nsecond" << std::endl;

  auto messages = LogStreamBuffer::get_messages(10);
  ASSERT_EQ(2u, messages.size());
  EXPECT_NE(std::string::npos, messages[0].find("[Msg] first"));
  EXPECT_NE(std::string::npos, messages[1].find("[Msg] second"));
}

TEST_F(LogStreamBufferTest, UnterminatedTextWaitsForNewline) {
  LogStreamBuffer buffer("[Err] ", closed_file_);
  std::ostream out(&buffer);
  out << "partial" << std::flush;
  EXPECT_TRUE(LogStreamBuffer::get_messages(10).empty());

  out << " line" << std::endl;
  auto messages = LogStreamBuffer::get_messages(10);
  ASSERT_EQ(1u, messages.size());
  EXPECT_NE(std::string::npos, messages[0].find("[Err] partial line"));
}

TEST_F(LogStreamBufferTest, RingIsTrimmed) {
  LogStreamBuffer buffer("", closed_file_);
  std::ostream out(&buffer);
  for (int i = 0; i < 150; ++i) {
    out << "line " << i << std::endl;
  }

  auto messages = LogStreamBuffer::get_messages(1000);
  EXPECT_LE(messages.size(), LogStreamBuffer::MAX_MESSAGES);
  EXPECT_NE(std::string::npos, messages.back().find("line 149"));

  auto newest = LogStreamBuffer::get_messages(3);
  ASSERT_EQ(3u, newest.size());
  EXPECT_NE(std::string::npos, newest[0].find("line 147"));
}

TEST_F(LogStreamBufferTest, RedirectorRestoresStream) {
  std::ostringstream original;
  std::ostream stream(original.rdbuf());
  {
    LogStreamBuffer buffer("[Msg] ", closed_file_);
    StreamRedirector redirect(stream, &buffer);
    stream << "captured" << std::endl;
  }
  stream << "direct";

  EXPECT_EQ("direct", original.str());
  ASSERT_EQ(1u, LogStreamBuffer::get_messages(10).size());
}
