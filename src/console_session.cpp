#include "console_session.h"

#include <fmt/core.h>

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace {
std::chrono::milliseconds to_millis(double seconds) {
  return std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
}
}  // namespace

ConsoleSession::ConsoleSession(const ConsoleConfig& config,
                               Scheduler& scheduler, LogSource& log_source,
                               StatusSource& status_source)
    : config_(config),
      scheduler_(scheduler),
      log_source_(log_source),
      status_source_(status_source),
      follow_tail_(config.follow_tail),
      output_buffer_(config.max_output_chars),
      log_tail_buffer_(config.max_output_chars) {}

ConsoleSession::~ConsoleSession() { exit_mode(); }

bool ConsoleSession::enter_mode(Mode target, const ModeOptions& options) {
  if (target == mode_) {
    return false;
  }
  if (mode_ != Mode::Normal) {
    exit_mode();
  }
  if (target == Mode::Normal) {
    return true;
  }

  if (target == Mode::LogTail) {
    log_tail_buffer_.clear();
  }
  active_controller_ = make_controller(target, options);
  mode_ = target;
  std::clog << fmt::format("Entered {} mode.", mode_name(target)) << std::endl;

  active_controller_->start();
  request_redraw();
  return true;
}

void ConsoleSession::exit_mode() {
  if (mode_ == Mode::Normal) {
    return;
  }
  Mode exited = mode_;

  // cancel before detaching so no completion sees a half torn-down state
  if (active_controller_) {
    active_controller_->stop();
  }
  active_controller_.reset();
  mode_ = Mode::Normal;

  std::clog << fmt::format("Left {} mode.", mode_name(exited)) << std::endl;
  request_redraw();
}

void ConsoleSession::append_output(const std::string& text) {
  output_buffer_.append(text, follow_tail_);
  request_redraw();
}

void ConsoleSession::clear_output() {
  output_buffer_.clear();
  request_redraw();
}

void ConsoleSession::scroll(ScrollDirection direction, int page_lines) {
  follow_tail_ =
      scroll_buffer(output_buffer_, direction, page_lines, follow_tail_);
  request_redraw();
}

void ConsoleSession::quit() {
  if (quit_requested_) {
    return;
  }
  exit_mode();
  input_.clear();
  quit_requested_ = true;
  if (on_quit_) on_quit_();
}

void ConsoleSession::set_follow_tail(bool follow) {
  follow_tail_ = follow;
  if (follow_tail_) {
    output_buffer_.move_cursor_to_end();
  }
  request_redraw();
}

LogTailController* ConsoleSession::log_tail_controller() {
  return mode_ == Mode::LogTail
             ? static_cast<LogTailController*>(active_controller_.get())
             : nullptr;
}

WatchController* ConsoleSession::watch_controller() {
  return mode_ == Mode::Watch
             ? static_cast<WatchController*>(active_controller_.get())
             : nullptr;
}

LogViewController* ConsoleSession::log_view_controller() {
  return mode_ == Mode::LogView
             ? static_cast<LogViewController*>(active_controller_.get())
             : nullptr;
}

const TextBuffer& ConsoleSession::visible_buffer() const {
  if (active_controller_) {
    return active_controller_->view();
  }
  return output_buffer_;
}

void ConsoleSession::request_redraw() {
  if (on_redraw_) on_redraw_();
}

std::unique_ptr<ModeController> ConsoleSession::make_controller(
    Mode target, const ModeOptions& options) {
  auto on_update = [this] { request_redraw(); };

  switch (target) {
    case Mode::LogTail:
      return std::make_unique<LogTailController>(
          log_source_, scheduler_, log_tail_buffer_, options.filter,
          to_millis(config_.tail_poll_interval_s), on_update);
    case Mode::Watch:
      return std::make_unique<WatchController>(
          status_source_, scheduler_, options.watch_target,
          options.interval_s.value_or(config_.watch_interval_s), on_update);
    case Mode::LogView: {
      LogPageQuery query;
      query.page_size = config_.log_view_page_size;
      query.filter = options.filter;
      query.search = options.search;
      return std::make_unique<LogViewController>(
          log_source_, scheduler_, query, options.follow,
          to_millis(config_.log_view_follow_interval_s), on_update);
    }
    case Mode::Normal:
      break;
  }
  throw std::logic_error("Normal mode has no controller");
}
