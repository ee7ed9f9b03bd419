#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "api.h"
#include "dmxconsole.h"
#include "modes/log_tail_controller.h"
#include "modes/log_view_controller.h"
#include "modes/mode_controller.h"
#include "modes/watch_controller.h"
#include "scheduler.h"
#include "text_buffer.h"

// Parameters for the controller built on mode entry. Fields that do not
// apply to the target mode are ignored.
struct ModeOptions {
  LogFilter filter;
  std::optional<std::string> search;
  std::string watch_target = "status";
  std::optional<double> interval_s;
  bool follow = false;
};

// Owns the input/output surface and at most one active mode controller.
// All members are touched from the UI loop thread only.
class ConsoleSession {
 public:
  ConsoleSession(const ConsoleConfig& config, Scheduler& scheduler,
                 LogSource& log_source, StatusSource& status_source);
  ~ConsoleSession();

  ConsoleSession(const ConsoleSession&) = delete;
  ConsoleSession& operator=(const ConsoleSession&) = delete;

  Mode mode() const { return mode_; }

  /**
   * @return false if `target` is already the current mode.
   */
  bool enter_mode(Mode target, const ModeOptions& options = {});

  // No-op in normal mode.
  void exit_mode();

  void append_output(const std::string& text);
  void clear_output();
  void scroll(ScrollDirection direction, int page_lines);

  // Leaves the active mode, drops the unsent input and asks the host to stop.
  void quit();
  bool quit_requested() const { return quit_requested_; }

  bool follow_tail() const { return follow_tail_; }
  void set_follow_tail(bool follow);

  TextBuffer& output_buffer() { return output_buffer_; }
  const TextBuffer& output_buffer() const { return output_buffer_; }
  TextBuffer& log_tail_buffer() { return log_tail_buffer_; }
  const TextBuffer& log_tail_buffer() const { return log_tail_buffer_; }

  std::string& input() { return input_; }

  ModeController* active_controller() { return active_controller_.get(); }
  const ModeController* active_controller() const {
    return active_controller_.get();
  }
  LogTailController* log_tail_controller();
  WatchController* watch_controller();
  LogViewController* log_view_controller();

  // Buffer shown in the main pane for the current mode.
  const TextBuffer& visible_buffer() const;

  void request_redraw();
  void set_redraw_callback(std::function<void()> callback) {
    on_redraw_ = std::move(callback);
  }
  void set_quit_callback(std::function<void()> callback) {
    on_quit_ = std::move(callback);
  }

  Scheduler& scheduler() { return scheduler_; }
  StatusSource& status_source() { return status_source_; }
  const ConsoleConfig& config() const { return config_; }

 private:
  std::unique_ptr<ModeController> make_controller(Mode target,
                                                  const ModeOptions& options);

  ConsoleConfig config_;
  Scheduler& scheduler_;
  LogSource& log_source_;
  StatusSource& status_source_;

  Mode mode_ = Mode::Normal;
  bool follow_tail_;
  bool quit_requested_ = false;
  TextBuffer output_buffer_;
  TextBuffer log_tail_buffer_;
  std::string input_;
  std::unique_ptr<ModeController> active_controller_;

  std::function<void()> on_redraw_;
  std::function<void()> on_quit_;
};
