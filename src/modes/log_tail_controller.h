#pragma once

#include <chrono>

#include "../api.h"
#include "../scheduler.h"
#include "mode_controller.h"

class LogTailController : public ModeController {
 public:
  LogTailController(LogSource& source, Scheduler& scheduler, TextBuffer& buffer,
                    LogFilter filter, std::chrono::milliseconds poll_interval,
                    UpdateCallback on_update);
  ~LogTailController() override;

  Mode mode() const override { return Mode::LogTail; }
  void start() override;
  void stop() override;
  const TextBuffer& view() const override { return buffer_; }
  std::string status_line() const override;

  void enable_follow_tail();
  bool follow_tail() const { return follow_tail_; }
  void scroll(ScrollDirection direction, int page_lines);

  // Filter editing has no dialog yet; points the user at the command form.
  void show_filter_notice();

  const LogFilter& filter() const { return filter_; }
  unsigned long long last_seq() const { return last_seq_; }

  static inline const std::string FILTER_NOTICE =
      "[Filter UI not yet implemented - use 'logs tail --level LEVEL "
      "--logger LOGGER' to set filters]";

 private:
  void poll();
  void on_lines(const ApiResult<std::vector<LogLine>>& result);
  void append(const std::string& text);

  LogSource& source_;
  Scheduler& scheduler_;
  TextBuffer& buffer_;
  LogFilter filter_;
  std::chrono::milliseconds poll_interval_;

  bool follow_tail_ = true;
  bool last_poll_failed_ = false;
  unsigned long long last_seq_ = 0;
  TaskHandle poll_task_;
};
