#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Payload-or-error value delivered by the external collaborators.
template <typename T>
class ApiResult {
 public:
  static ApiResult success(T value) { return ApiResult(std::move(value), {}); }
  static ApiResult failure(std::string error) {
    return ApiResult(std::nullopt, std::move(error));
  }

  bool ok() const { return value_.has_value(); }
  const T& value() const { return *value_; }
  T& value() { return *value_; }
  const std::string& error() const { return error_; }

 private:
  ApiResult(std::optional<T> value, std::string error)
      : value_(std::move(value)), error_(std::move(error)) {}

  std::optional<T> value_;
  std::string error_;
};

struct LogLine {
  unsigned long long seq = 0;
  std::string timestamp;
  std::string level;
  std::string logger;
  std::string message;
};

struct LogFilter {
  std::optional<std::string> level;
  std::optional<std::string> logger;

  /**
   * @return true if the line passes both filters. Level matching is
   * case-insensitive, logger matching is by prefix so "dmx" matches
   * "dmx.sender".
   */
  bool matches(const LogLine& line) const;
};

struct LogPageQuery {
  int page = 0;
  int page_size = 50;
  LogFilter filter;
  std::optional<std::string> search;
};

struct LogPage {
  std::vector<LogLine> lines;
  int page = 0;
  int total_pages = 0;
  bool has_next = false;
  bool has_prev = false;
};

struct StatusSnapshot {
  std::string title;
  std::vector<std::pair<std::string, std::string>> rows;
};

std::string format_log_line(const LogLine& line);
std::string format_snapshot(const StatusSnapshot& snapshot);

// Completion callbacks are invoked on the scheduler's loop thread.
class LogSource {
 public:
  using TailCallback = std::function<void(ApiResult<std::vector<LogLine>>)>;
  using PageCallback = std::function<void(ApiResult<LogPage>)>;

  virtual ~LogSource() = default;

  /**
   * @brief Poll form of a log subscription: delivers the lines newer than
   * `after_seq` that pass `filter`.
   */
  virtual void fetch_tail(const LogFilter& filter, unsigned long long after_seq,
                          TailCallback callback) = 0;
  virtual void query_page(const LogPageQuery& query, PageCallback callback) = 0;
};

class StatusSource {
 public:
  using Callback = std::function<void(ApiResult<StatusSnapshot>)>;

  virtual ~StatusSource() = default;
  virtual void query(const std::string& target, Callback callback) = 0;
};
