#include "stream_redirect.h"

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <ctime>

std::vector<std::string> LogStreamBuffer::messages_;
std::mutex LogStreamBuffer::messages_mutex_;

int LogStreamBuffer::sync() {
  std::string content = str();
  if (content.empty()) {
    return 0;
  }
  str("");

  size_t start = 0;
  size_t end;
  while ((end = content.find('\n', start)) != std::string::npos) {
    std::string line = fmt::format("{:%H:%M:%S} {}{}",
                                   fmt::localtime(std::time(nullptr)), tag_,
                                   content.substr(start, end - start));
    {
      std::lock_guard<std::mutex> lock(messages_mutex_);
      messages_.push_back(line);
      if (messages_.size() > MAX_MESSAGES) {
        messages_.erase(messages_.begin(),
                        messages_.end() - TRIMMED_MESSAGES);
      }
    }
    if (log_file_.is_open()) {
      log_file_ << line << std::endl;
    }
    start = end + 1;
  }

  // keep an unterminated tail for the next flush
  if (start < content.size()) {
    sputn(content.c_str() + start, content.size() - start);
  }
  return 0;
}

std::vector<std::string> LogStreamBuffer::get_messages(size_t count) {
  std::lock_guard<std::mutex> lock(messages_mutex_);
  size_t first = messages_.size() > count ? messages_.size() - count : 0;
  return std::vector<std::string>(messages_.begin() + first, messages_.end());
}

void LogStreamBuffer::clear_messages() {
  std::lock_guard<std::mutex> lock(messages_mutex_);
  messages_.clear();
}
