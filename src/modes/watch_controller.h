#pragma once

#include <chrono>
#include <string>

#include "../api.h"
#include "../scheduler.h"
#include "mode_controller.h"

// Re-queries one status target on a fixed interval and shows the latest
// snapshot.
class WatchController : public ModeController {
 public:
  static inline const double MIN_INTERVAL_S = 0.5;
  static inline const double INTERVAL_STEP_S = 0.5;
  // longest wait a single timer is armed for; fits the clock's tick count
  static inline const double MAX_DELAY_S = 1e9;

  WatchController(StatusSource& source, Scheduler& scheduler,
                  std::string target, double interval_s,
                  UpdateCallback on_update);
  ~WatchController() override;

  Mode mode() const override { return Mode::Watch; }
  void start() override;
  void stop() override;
  const TextBuffer& view() const override { return view_; }
  std::string status_line() const override;

  /**
   * @brief Takes effect from the next tick; a query in flight is left alone.
   * Values below MIN_INTERVAL_S are clamped.
   */
  void set_interval(double interval_s);
  void faster() { set_interval(refresh_interval_ - INTERVAL_STEP_S); }
  void slower() { set_interval(refresh_interval_ + INTERVAL_STEP_S); }

  double refresh_interval() const { return refresh_interval_; }
  bool running() const { return running_; }
  const std::string& target() const { return target_; }
  int refresh_count() const { return refresh_count_; }

 private:
  void tick();
  void arm_next_tick();
  void render(const ApiResult<StatusSnapshot>& result);

  StatusSource& source_;
  Scheduler& scheduler_;
  std::string target_;
  double refresh_interval_;

  bool running_ = false;
  int refresh_count_ = 0;
  TaskHandle tick_task_;
  Scheduler::Clock::time_point last_refresh_;
  TextBuffer view_;
};
