#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

// Handle to a timer registered with Scheduler. Copies share the same timer.
class TaskHandle {
 public:
  TaskHandle() = default;

  void cancel();
  bool active() const;

 private:
  friend class Scheduler;
  struct State {
    bool cancelled = false;
    bool fired = false;
  };
  explicit TaskHandle(std::shared_ptr<State> state) : state_(std::move(state)) {}

  std::shared_ptr<State> state_;
};

// Cooperative task queue drained once per frame by the UI loop. Everything
// it runs executes on the loop thread; only post() may be called from other
// threads.
class Scheduler {
 public:
  using Clock = std::chrono::steady_clock;
  using Callback = std::function<void()>;

  Scheduler() = default;
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  void post(Callback fn);

  TaskHandle schedule_after(Clock::duration delay, Callback fn);
  TaskHandle schedule_at(Clock::time_point deadline, Callback fn);

  /**
   * @brief Runs posted callbacks, then the timers due at `now`.
   * @return number of callbacks run.
   */
  size_t run_pending(Clock::time_point now);
  size_t run_pending() { return run_pending(Clock::now()); }

  size_t pending_timers() const;

  /**
   * @brief Time used for new timers. Tests pin it to drive timers manually.
   */
  void set_time_source(std::function<Clock::time_point()> source) {
    time_source_ = std::move(source);
  }
  Clock::time_point now() const {
    return time_source_ ? time_source_() : Clock::now();
  }

 private:
  struct Timer {
    Clock::time_point deadline;
    unsigned long long seq;
    std::shared_ptr<TaskHandle::State> state;
    Callback fn;
  };

  std::mutex post_mutex_;
  std::vector<Callback> posted_;

  std::vector<Timer> timers_;
  unsigned long long next_seq_ = 0;
  std::function<Clock::time_point()> time_source_;
};
