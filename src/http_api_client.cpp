#include "http_api_client.h"

#include <curl/curl.h>
#include <fmt/core.h>

#include <iostream>
#include <memory>
#include <stdexcept>

#include "api_json.h"

using json = nlohmann::json;

namespace {
size_t write_body(char* data, size_t size, size_t count, void* userdata) {
  static_cast<std::string*>(userdata)->append(data, size * count);
  return size * count;
}

struct CurlDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
}  // namespace

HttpApiClient::HttpApiClient(const ConsoleConfig& config, Scheduler& scheduler)
    : base_url_(config.server_url),
      timeout_ms_(static_cast<long>(config.request_timeout_s * 1000)),
      scheduler_(scheduler) {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("Failed to initialize libcurl");
  }
  worker_ = std::thread([this] { worker_loop(); });
}

HttpApiClient::~HttpApiClient() {
  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    stopping_ = true;
    jobs_.clear();
  }
  jobs_cv_.notify_all();
  worker_.join();
  curl_global_cleanup();
}

void HttpApiClient::fetch_tail(const LogFilter& filter,
                               unsigned long long after_seq,
                               TailCallback callback) {
  std::string path = fmt::format("/logs/tail?after={}", after_seq);
  if (filter.level) path += "&level=" + escape(*filter.level);
  if (filter.logger) path += "&logger=" + escape(*filter.logger);

  submit<std::vector<LogLine>>(
      [this, path] { return ApiJson::parse_log_lines(get_json(path)); },
      std::move(callback));
}

void HttpApiClient::query_page(const LogPageQuery& query,
                               PageCallback callback) {
  std::string path = fmt::format("/logs?limit={}&offset={}", query.page_size,
                                 query.page * query.page_size);
  if (query.filter.level) path += "&level=" + escape(*query.filter.level);
  if (query.filter.logger) path += "&logger=" + escape(*query.filter.logger);
  if (query.search) path += "&search=" + escape(*query.search);

  submit<LogPage>(
      [this, path, query] {
        return ApiJson::parse_log_page(get_json(path), query);
      },
      std::move(callback));
}

void HttpApiClient::query(const std::string& target, Callback callback) {
  submit<StatusSnapshot>(
      [this, target] {
        return ApiJson::parse_snapshot(target, get_json("/" + target));
      },
      std::move(callback));
}

json HttpApiClient::get_json(const std::string& path) {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw std::runtime_error("Failed to create curl handle");
  }

  std::string url = base_url_ + path;
  std::string body;
  char error_buf[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buf);

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw std::runtime_error(fmt::format(
        "GET {} failed: {}", path,
        error_buf[0] ? error_buf : curl_easy_strerror(res)));
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    throw std::runtime_error(
        fmt::format("GET {} returned HTTP {}", path, status));
  }
  return json::parse(body);
}

std::string HttpApiClient::escape(const std::string& value) {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    return value;
  }
  char* escaped =
      curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
  if (escaped == nullptr) {
    return value;
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

template <typename T>
void HttpApiClient::submit(std::function<T()> work,
                           std::function<void(ApiResult<T>)> callback) {
  auto job = [this, work = std::move(work), callback = std::move(callback)] {
    auto result = std::make_shared<ApiResult<T>>(ApiResult<T>::failure(""));
    try {
      *result = ApiResult<T>::success(work());
    } catch (const std::exception& e) {
      *result = ApiResult<T>::failure(e.what());
    }
    scheduler_.post([callback, result] { callback(std::move(*result)); });
  };

  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    if (stopping_) return;
    jobs_.push_back(std::move(job));
  }
  jobs_cv_.notify_one();
}

void HttpApiClient::worker_loop() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(jobs_mutex_);
      jobs_cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (stopping_) return;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    job();
  }
}
