#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Append-only scrollable text with a cursor. The rendered viewport follows
// the line that contains the cursor.
class TextBuffer {
 public:
  explicit TextBuffer(size_t max_chars = 0) : max_chars_(max_chars) {}

  /**
   * @param move_cursor_to_end when true the cursor lands on the new end,
   * otherwise the cursor is left where it was.
   */
  void append(const std::string& text, bool move_cursor_to_end);
  void set_text(const std::string& text);
  void clear();

  size_t cursor() const { return cursor_; }
  void set_cursor(size_t pos);
  void move_cursor_to_end() { cursor_ = text_.size(); }

  size_t size() const { return text_.size(); }
  bool empty() const { return text_.empty(); }
  const std::string& text() const { return text_; }

  std::vector<std::string> lines() const;
  size_t cursor_line() const;

 private:
  void trim_front();

  std::string text_;
  size_t cursor_ = 0;
  size_t max_chars_;  // 0 means unbounded
};

enum class ScrollDirection { Up, Down };

// Wrapped line counts are not tracked, so a page is approximated in chars.
inline constexpr size_t ASSUMED_LINE_WIDTH = 80;
inline constexpr size_t FOLLOW_RESUME_THRESHOLD = 10;

/**
 * @brief Moves the cursor of `buffer` by `page_lines` approximate lines.
 * Scrolling up always turns follow-tail off; scrolling down turns it back on
 * once the cursor is within FOLLOW_RESUME_THRESHOLD chars of the end.
 * @return the new follow-tail state.
 */
bool scroll_buffer(TextBuffer& buffer, ScrollDirection direction,
                   int page_lines, bool follow_tail);
