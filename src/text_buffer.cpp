#include "text_buffer.h"

#include <algorithm>

void TextBuffer::append(const std::string& text, bool move_cursor_to_end) {
  text_ += text;
  trim_front();
  if (move_cursor_to_end) {
    cursor_ = text_.size();
  }
}

void TextBuffer::set_text(const std::string& text) {
  text_ = text;
  trim_front();
  cursor_ = std::min(cursor_, text_.size());
}

void TextBuffer::clear() {
  text_.clear();
  cursor_ = 0;
}

void TextBuffer::set_cursor(size_t pos) { cursor_ = std::min(pos, text_.size()); }

std::vector<std::string> TextBuffer::lines() const {
  std::vector<std::string> result;
  size_t start = 0;
  while (start < text_.size()) {
    size_t end = text_.find('\n', start);
    if (end == std::string::npos) {
      result.push_back(text_.substr(start));
      break;
    }
    result.push_back(text_.substr(start, end - start));
    start = end + 1;
  }
  return result;
}

size_t TextBuffer::cursor_line() const {
  if (text_.empty()) return 0;
  size_t pos = std::min(cursor_, text_.size());
  // a cursor sitting right after the final newline belongs to the last line
  if (pos == text_.size() && text_.back() == '\n') {
    pos--;
  }
  return std::count(text_.begin(), text_.begin() + pos, '\n');
}

void TextBuffer::trim_front() {
  if (max_chars_ == 0 || text_.size() <= max_chars_) return;

  size_t excess = text_.size() - max_chars_;
  size_t cut = text_.find('\n', excess - 1);
  cut = (cut == std::string::npos) ? excess : cut + 1;

  text_.erase(0, cut);
  cursor_ = cursor_ > cut ? cursor_ - cut : 0;
}

bool scroll_buffer(TextBuffer& buffer, ScrollDirection direction,
                   int page_lines, bool follow_tail) {
  size_t delta = static_cast<size_t>(std::max(page_lines, 1)) * ASSUMED_LINE_WIDTH;

  if (direction == ScrollDirection::Up) {
    size_t cursor = buffer.cursor();
    buffer.set_cursor(cursor > delta ? cursor - delta : 0);
    return false;
  }

  buffer.set_cursor(std::min(buffer.size(), buffer.cursor() + delta));
  if (buffer.cursor() + FOLLOW_RESUME_THRESHOLD >= buffer.size()) {
    return true;
  }
  return follow_tail;
}
