#include "log_view_controller.h"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <iterator>

namespace {
bool same_level(const std::string& a, const std::string& b) {
  return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
    return std::toupper(static_cast<unsigned char>(x)) ==
           std::toupper(static_cast<unsigned char>(y));
  });
}
}  // namespace

LogViewController::LogViewController(LogSource& source, Scheduler& scheduler,
                                     LogPageQuery query, bool follow_mode,
                                     std::chrono::milliseconds follow_interval,
                                     UpdateCallback on_update)
    : ModeController(std::move(on_update)),
      source_(source),
      scheduler_(scheduler),
      page_(std::max(0, query.page)),
      page_size_(std::max(1, query.page_size)),
      filter_(std::move(query.filter)),
      search_(std::move(query.search)),
      follow_mode_(follow_mode),
      follow_interval_(follow_interval) {
  view_.set_text("Loading logs...\n");
}

LogViewController::~LogViewController() { stop(); }

void LogViewController::start() {
  set_alive(true);
  refresh();
  if (follow_mode_) {
    schedule_follow();
  }
}

void LogViewController::stop() {
  set_alive(false);
  follow_task_.cancel();
}

std::string LogViewController::status_line() const {
  return fmt::format(
      "LOG VIEW | {}PgUp/PgDn page, Home/End first/last, l level, "
      "c clear logger, r refresh, Space follow, Esc/q exit",
      notice_.empty() ? "" : notice_ + " | ");
}

bool LogViewController::navigate_page(PageTarget target) {
  int before = page_;
  switch (target) {
    case PageTarget::First:
      page_ = 0;
      break;
    case PageTarget::Prev:
      page_ = std::max(0, page_ - 1);
      break;
    case PageTarget::Next:
      page_ = std::min(last_page(), page_ + 1);
      break;
    case PageTarget::Last:
      page_ = last_page();
      break;
  }
  return page_ != before;
}

bool LogViewController::is_cycle_level(const std::string& level) {
  return std::any_of(LEVEL_CYCLE.begin(), LEVEL_CYCLE.end(),
                     [&level](const std::optional<std::string>& entry) {
                       return entry && same_level(*entry, level);
                     });
}

void LogViewController::cycle_level_filter() {
  auto it = std::find_if(
      LEVEL_CYCLE.begin(), LEVEL_CYCLE.end(),
      [this](const std::optional<std::string>& level) {
        if (!level || !filter_.level) return !level && !filter_.level;
        return same_level(*level, *filter_.level);
      });
  size_t index = (it == LEVEL_CYCLE.end())
                     ? 0
                     : (std::distance(LEVEL_CYCLE.begin(), it) + 1) %
                           LEVEL_CYCLE.size();
  filter_.level = LEVEL_CYCLE[index];
  page_ = 0;
}

void LogViewController::set_logger_filter(std::optional<std::string> logger) {
  if (logger && logger->empty()) {
    logger.reset();
  }
  filter_.logger = std::move(logger);
  page_ = 0;
}

void LogViewController::set_search(std::optional<std::string> pattern) {
  if (pattern && pattern->empty()) {
    pattern.reset();
  }
  search_ = std::move(pattern);
  page_ = 0;
}

void LogViewController::toggle_follow_mode() {
  follow_mode_ = !follow_mode_;
  if (follow_mode_) {
    page_ = last_page();
    schedule_follow();
  } else {
    follow_task_.cancel();
  }
  notify_update();
}

void LogViewController::refresh() {
  LogPageQuery query;
  query.page = page_;
  query.page_size = page_size_;
  query.filter = filter_;
  query.search = search_;

  unsigned long long request = ++latest_request_;
  bool pinned_to_last = page_ == last_page();
  source_.query_page(
      query, while_alive([this, request, query,
                          pinned_to_last](const ApiResult<LogPage>& r) {
        if (request != latest_request_) {
          return;  // superseded by a newer refresh
        }
        apply(query, pinned_to_last, r);
      }));
}

void LogViewController::show_notice(const std::string& notice) {
  notice_ = notice;
  notify_update();
}

void LogViewController::apply(const LogPageQuery& requested,
                              bool pinned_to_last,
                              const ApiResult<LogPage>& result) {
  if (!result.ok()) {
    view_.set_text(header() + fmt::format("[Error loading logs: {}]\n",
                                          result.error()));
    std::cerr << fmt::format("Log page {} failed: {}", requested.page + 1,
                             result.error())
              << std::endl;
    notify_update();
    return;
  }

  const LogPage& log_page = result.value();
  total_pages_ = std::max(0, log_page.total_pages);
  page_ = std::clamp(requested.page, 0, last_page());

  if (follow_mode_ && pinned_to_last && page_ < last_page()) {
    // new pages appeared since the request; chase the newest one.
    // A page the user navigated to stays until the next follow tick.
    page_ = last_page();
    refresh();
    return;
  }

  std::string body = header();
  for (const auto& line : log_page.lines) {
    body += format_log_line(line) + "\n";
  }
  if (log_page.lines.empty()) {
    body += "(no log entries)\n";
  }
  view_.set_text(body);
  if (follow_mode_) {
    view_.move_cursor_to_end();
  } else {
    view_.set_cursor(0);
  }
  notify_update();
}

void LogViewController::schedule_follow() {
  follow_task_.cancel();
  follow_task_ = scheduler_.schedule_after(
      follow_interval_, while_alive([this] {
        if (!follow_mode_) return;
        page_ = last_page();
        refresh();
        schedule_follow();
      }));
}

std::string LogViewController::header() const {
  return fmt::format(
      "Page {}/{} | level: {} | logger: {} | search: {} | follow: {}\n\n",
      page_ + 1, std::max(total_pages_, 1), filter_.level.value_or("all"),
      filter_.logger.value_or("all"), search_.value_or("-"),
      follow_mode_ ? "on" : "off");
}
