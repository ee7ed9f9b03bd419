#include "scheduler.h"

#include <algorithm>

void TaskHandle::cancel() {
  if (state_) {
    state_->cancelled = true;
  }
}

bool TaskHandle::active() const {
  return state_ && !state_->cancelled && !state_->fired;
}

void Scheduler::post(Callback fn) {
  std::lock_guard<std::mutex> lock(post_mutex_);
  posted_.push_back(std::move(fn));
}

TaskHandle Scheduler::schedule_after(Clock::duration delay, Callback fn) {
  return schedule_at(now() + delay, std::move(fn));
}

TaskHandle Scheduler::schedule_at(Clock::time_point deadline, Callback fn) {
  auto state = std::make_shared<TaskHandle::State>();
  timers_.push_back(Timer{deadline, next_seq_++, state, std::move(fn)});
  return TaskHandle(state);
}

size_t Scheduler::run_pending(Clock::time_point now) {
  size_t ran = 0;

  std::vector<Callback> posted;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    posted.swap(posted_);
  }
  for (auto& fn : posted) {
    fn();
    ran++;
  }

  // timers armed by the callbacks below wait for the next drain
  std::vector<Timer> due;
  auto split = std::stable_partition(
      timers_.begin(), timers_.end(), [now](const Timer& t) {
        return !t.state->cancelled && t.deadline > now;
      });
  for (auto it = split; it != timers_.end(); ++it) {
    if (!it->state->cancelled) {
      due.push_back(std::move(*it));
    }
  }
  timers_.erase(split, timers_.end());

  std::sort(due.begin(), due.end(), [](const Timer& a, const Timer& b) {
    return a.deadline != b.deadline ? a.deadline < b.deadline : a.seq < b.seq;
  });
  for (auto& timer : due) {
    // an earlier timer in this batch may have cancelled this one
    if (timer.state->cancelled) continue;
    timer.state->fired = true;
    timer.fn();
    ran++;
  }
  return ran;
}

size_t Scheduler::pending_timers() const {
  return std::count_if(timers_.begin(), timers_.end(), [](const Timer& t) {
    return !t.state->cancelled;
  });
}
