#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "api.h"
#include "dmxconsole.h"
#include "nlohmann/json.hpp"
#include "scheduler.h"

// REST client for the bridge. Requests run one at a time on a worker
// thread; completions are handed to the UI loop through Scheduler::post.
class HttpApiClient : public LogSource, public StatusSource {
 public:
  HttpApiClient(const ConsoleConfig& config, Scheduler& scheduler);
  ~HttpApiClient() override;

  HttpApiClient(const HttpApiClient&) = delete;
  HttpApiClient& operator=(const HttpApiClient&) = delete;

  void fetch_tail(const LogFilter& filter, unsigned long long after_seq,
                  TailCallback callback) override;
  void query_page(const LogPageQuery& query, PageCallback callback) override;
  void query(const std::string& target, Callback callback) override;

  /**
   * @brief Blocking GET of `path` (with query string) below the server URL.
   * @throw std::runtime_error on transport errors and non-2xx statuses.
   */
  nlohmann::json get_json(const std::string& path);

  std::string escape(const std::string& value);

 private:
  // Runs `work` on the worker and posts its result, or its error text.
  template <typename T>
  void submit(std::function<T()> work,
              std::function<void(ApiResult<T>)> callback);

  void worker_loop();

  std::string base_url_;
  long timeout_ms_;
  Scheduler& scheduler_;

  std::mutex jobs_mutex_;
  std::condition_variable jobs_cv_;
  std::deque<std::function<void()>> jobs_;
  bool stopping_ = false;
  std::thread worker_;
};
