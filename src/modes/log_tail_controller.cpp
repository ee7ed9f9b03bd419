#include "log_tail_controller.h"

#include <fmt/core.h>

#include <algorithm>
#include <iostream>

LogTailController::LogTailController(LogSource& source, Scheduler& scheduler,
                                     TextBuffer& buffer, LogFilter filter,
                                     std::chrono::milliseconds poll_interval,
                                     UpdateCallback on_update)
    : ModeController(std::move(on_update)),
      source_(source),
      scheduler_(scheduler),
      buffer_(buffer),
      filter_(std::move(filter)),
      poll_interval_(poll_interval) {}

LogTailController::~LogTailController() { stop(); }

void LogTailController::start() {
  set_alive(true);
  append(fmt::format("--- Tailing logs (level: {}, logger: {}) ---\n",
                     filter_.level.value_or("all"),
                     filter_.logger.value_or("all")));
  poll();
}

void LogTailController::stop() {
  set_alive(false);
  poll_task_.cancel();
}

std::string LogTailController::status_line() const {
  return fmt::format(
      "LOG TAIL | level: {} | logger: {} | follow: {} | "
      "Esc/q exit, End follow, PgUp/PgDn scroll, f filter",
      filter_.level.value_or("all"), filter_.logger.value_or("all"),
      follow_tail_ ? "on" : "off");
}

void LogTailController::enable_follow_tail() {
  follow_tail_ = true;
  buffer_.move_cursor_to_end();
}

void LogTailController::scroll(ScrollDirection direction, int page_lines) {
  follow_tail_ = scroll_buffer(buffer_, direction, page_lines, follow_tail_);
}

void LogTailController::show_filter_notice() {
  append(FILTER_NOTICE + "\n");
  notify_update();
}

void LogTailController::poll() {
  source_.fetch_tail(
      filter_, last_seq_,
      while_alive([this](const ApiResult<std::vector<LogLine>>& result) {
        on_lines(result);
        poll_task_ = scheduler_.schedule_after(
            poll_interval_, while_alive([this] { poll(); }));
      }));
}

void LogTailController::on_lines(
    const ApiResult<std::vector<LogLine>>& result) {
  if (!result.ok()) {
    // one notice per outage, not one per poll
    if (!last_poll_failed_) {
      append(fmt::format("[Log tail error: {}]\n", result.error()));
      std::cerr << fmt::format("Log tail failed: {}", result.error())
                << std::endl;
      notify_update();
    }
    last_poll_failed_ = true;
    return;
  }
  last_poll_failed_ = false;

  bool appended = false;
  for (const auto& line : result.value()) {
    last_seq_ = std::max(last_seq_, line.seq);
    if (!filter_.matches(line)) continue;
    append(format_log_line(line) + "\n");
    appended = true;
  }
  if (appended) {
    notify_update();
  }
}

void LogTailController::append(const std::string& text) {
  buffer_.append(text, follow_tail_);
}
