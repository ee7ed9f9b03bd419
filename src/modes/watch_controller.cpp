#include "watch_controller.h"

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <algorithm>
#include <ctime>
#include <iostream>

WatchController::WatchController(StatusSource& source, Scheduler& scheduler,
                                 std::string target, double interval_s,
                                 UpdateCallback on_update)
    : ModeController(std::move(on_update)),
      source_(source),
      scheduler_(scheduler),
      target_(std::move(target)),
      refresh_interval_(std::max(MIN_INTERVAL_S, interval_s)) {
  view_.set_text(fmt::format("Watching {}...\n", target_));
}

WatchController::~WatchController() { stop(); }

void WatchController::start() {
  set_alive(true);
  running_ = true;
  tick();
}

void WatchController::stop() {
  // the loop is dead before anyone can observe running_ == false
  set_alive(false);
  tick_task_.cancel();
  running_ = false;
}

std::string WatchController::status_line() const {
  return fmt::format(
      "WATCH {} | every {:.1f}s | Esc/q exit, + faster, - slower", target_,
      refresh_interval_);
}

void WatchController::set_interval(double interval_s) {
  refresh_interval_ = std::max(MIN_INTERVAL_S, interval_s);
  // re-arm a pending wait; a query in flight picks the value up when it lands
  if (tick_task_.active()) {
    arm_next_tick();
  }
  notify_update();
}

void WatchController::tick() {
  source_.query(target_,
                while_alive([this](const ApiResult<StatusSnapshot>& result) {
                  last_refresh_ = scheduler_.now();
                  render(result);
                  arm_next_tick();
                }));
}

void WatchController::arm_next_tick() {
  tick_task_.cancel();
  auto delay = std::chrono::duration_cast<Scheduler::Clock::duration>(
      std::chrono::duration<double>(std::min(refresh_interval_, MAX_DELAY_S)));
  tick_task_ = scheduler_.schedule_at(last_refresh_ + delay,
                                      while_alive([this] { tick(); }));
}

void WatchController::render(const ApiResult<StatusSnapshot>& result) {
  refresh_count_++;

  std::time_t now = std::time(nullptr);
  std::string header =
      fmt::format("Every {:.1f}s: {}    {:%H:%M:%S}\n\n", refresh_interval_,
                  target_, fmt::localtime(now));

  if (result.ok()) {
    view_.set_text(header + format_snapshot(result.value()));
  } else {
    view_.set_text(header + fmt::format("[Error querying {}: {}]\n", target_,
                                        result.error()));
    std::cerr << fmt::format("Watch query for {} failed: {}", target_,
                             result.error())
              << std::endl;
  }
  notify_update();
}
