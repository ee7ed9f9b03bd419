#pragma once

#include <deque>
#include <string>
#include <vector>

#include "api.h"
#include "scheduler.h"

namespace test_support {

// Records every call; tests decide when and how each one completes.
class FakeLogSource : public LogSource {
 public:
  struct TailCall {
    LogFilter filter;
    unsigned long long after_seq;
    TailCallback callback;
  };
  struct PageCall {
    LogPageQuery query;
    PageCallback callback;
  };

  void fetch_tail(const LogFilter& filter, unsigned long long after_seq,
                  TailCallback callback) override {
    tail_calls.push_back(TailCall{filter, after_seq, std::move(callback)});
  }

  void query_page(const LogPageQuery& query, PageCallback callback) override {
    page_calls.push_back(PageCall{query, std::move(callback)});
  }

  void complete_tail(std::vector<LogLine> lines) {
    TailCall call = std::move(tail_calls.front());
    tail_calls.pop_front();
    call.callback(ApiResult<std::vector<LogLine>>::success(std::move(lines)));
  }

  void fail_tail(const std::string& error) {
    TailCall call = std::move(tail_calls.front());
    tail_calls.pop_front();
    call.callback(ApiResult<std::vector<LogLine>>::failure(error));
  }

  // Completes the page call at `index` with a page of `total_pages`.
  void complete_page(size_t index, int total_pages,
                     std::vector<LogLine> lines = {}) {
    PageCall call = std::move(page_calls.at(index));
    page_calls.erase(page_calls.begin() + index);

    LogPage page;
    page.lines = std::move(lines);
    page.page = call.query.page;
    page.total_pages = total_pages;
    page.has_prev = call.query.page > 0;
    page.has_next = call.query.page + 1 < total_pages;
    call.callback(ApiResult<LogPage>::success(std::move(page)));
  }

  void fail_page(size_t index, const std::string& error) {
    PageCall call = std::move(page_calls.at(index));
    page_calls.erase(page_calls.begin() + index);
    call.callback(ApiResult<LogPage>::failure(error));
  }

  std::deque<TailCall> tail_calls;
  std::deque<PageCall> page_calls;
};

class FakeStatusSource : public StatusSource {
 public:
  struct Call {
    std::string target;
    Callback callback;
  };

  void query(const std::string& target, Callback callback) override {
    calls.push_back(Call{target, std::move(callback)});
  }

  void complete(StatusSnapshot snapshot) {
    Call call = std::move(calls.front());
    calls.pop_front();
    call.callback(ApiResult<StatusSnapshot>::success(std::move(snapshot)));
  }

  void fail(const std::string& error) {
    Call call = std::move(calls.front());
    calls.pop_front();
    call.callback(ApiResult<StatusSnapshot>::failure(error));
  }

  std::deque<Call> calls;
};

inline LogLine make_line(unsigned long long seq, const std::string& level,
                         const std::string& logger,
                         const std::string& message) {
  LogLine line;
  line.seq = seq;
  line.timestamp = "12:00:00";
  line.level = level;
  line.logger = logger;
  line.message = message;
  return line;
}

inline StatusSnapshot make_snapshot(const std::string& title) {
  StatusSnapshot snapshot;
  snapshot.title = title;
  snapshot.rows = {{"devices", "4"}, {"universes", "2"}};
  return snapshot;
}

// Drives a Scheduler with a hand-advanced clock.
class ManualClock {
 public:
  explicit ManualClock(Scheduler& scheduler) : scheduler_(scheduler) {
    scheduler_.set_time_source([this] { return now_; });
  }

  Scheduler::Clock::time_point now() const { return now_; }

  size_t advance(std::chrono::milliseconds delta) {
    now_ += delta;
    return scheduler_.run_pending(now_);
  }

 private:
  Scheduler& scheduler_;
  Scheduler::Clock::time_point now_{};
};

}  // namespace test_support
