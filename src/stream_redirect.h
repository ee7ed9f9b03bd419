#pragma once
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

// Line-buffers a std::ostream into the shared message ring and the log file.
class LogStreamBuffer : public std::stringbuf {
 public:
  static inline const size_t MAX_MESSAGES = 100;
  static inline const size_t TRIMMED_MESSAGES = 90;

  LogStreamBuffer(std::string tag, std::ofstream& log_file)
      : tag_(std::move(tag)), log_file_(log_file) {}
  ~LogStreamBuffer() override { pubsync(); }

  /**
   * @return the newest `count` messages, oldest first.
   */
  static std::vector<std::string> get_messages(size_t count);
  static void clear_messages();

 protected:
  int sync() override;

 private:
  std::string tag_;
  std::ofstream& log_file_;

  static std::vector<std::string> messages_;
  static std::mutex messages_mutex_;
};

// Swaps the buffer of a stream for the lifetime of this object.
class StreamRedirector {
 public:
  StreamRedirector(std::ostream& stream, std::streambuf* new_buf)
      : stream_(stream), old_buf_(stream.rdbuf(new_buf)) {}

  ~StreamRedirector() { stream_.rdbuf(old_buf_); }

  StreamRedirector(const StreamRedirector&) = delete;
  StreamRedirector& operator=(const StreamRedirector&) = delete;

 private:
  std::ostream& stream_;
  std::streambuf* old_buf_;
};
