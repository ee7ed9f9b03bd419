#pragma once

#include <array>
#include <chrono>
#include <optional>
#include <string>

#include "../api.h"
#include "../scheduler.h"
#include "mode_controller.h"

enum class PageTarget { First, Prev, Next, Last };

// Paginated browser over the service log. Only the newest refresh request
// may update the view.
class LogViewController : public ModeController {
 public:
  // std::nullopt is the unfiltered state
  static inline const std::array<std::optional<std::string>, 6> LEVEL_CYCLE = {
      std::nullopt, "DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"};

  // true for the named levels of LEVEL_CYCLE, ignoring case
  static bool is_cycle_level(const std::string& level);

  static inline const std::string FILTER_NOTICE =
      "[Logger filter input not yet implemented - use 'logs view --logger "
      "NAME' instead]";
  static inline const std::string SEARCH_NOTICE =
      "[Search input not yet implemented - use 'logs view --search PATTERN' "
      "instead]";
  static inline const std::string HELP_NOTICE =
      "[Help not yet implemented - use 'help' in normal mode instead]";

  LogViewController(LogSource& source, Scheduler& scheduler,
                    LogPageQuery query, bool follow_mode,
                    std::chrono::milliseconds follow_interval,
                    UpdateCallback on_update);
  ~LogViewController() override;

  Mode mode() const override { return Mode::LogView; }
  void start() override;
  void stop() override;
  const TextBuffer& view() const override { return view_; }
  std::string status_line() const override;

  /**
   * @return true if the page changed. prev at the first page and next at the
   * last known page are no-ops.
   */
  bool navigate_page(PageTarget target);
  void cycle_level_filter();
  void set_logger_filter(std::optional<std::string> logger);
  void set_search(std::optional<std::string> pattern);
  void toggle_follow_mode();

  // Re-queries the current page; the completion of an older call is dropped.
  void refresh();

  void show_notice(const std::string& notice);

  int page() const { return page_; }
  int last_page() const { return total_pages_ > 0 ? total_pages_ - 1 : 0; }
  int total_pages() const { return total_pages_; }
  bool follow_mode() const { return follow_mode_; }
  const LogFilter& filter() const { return filter_; }
  const std::optional<std::string>& search() const { return search_; }
  const std::string& notice() const { return notice_; }

 private:
  void apply(const LogPageQuery& requested, bool pinned_to_last,
             const ApiResult<LogPage>& result);
  void schedule_follow();
  std::string header() const;

  LogSource& source_;
  Scheduler& scheduler_;

  int page_;
  int page_size_;
  int total_pages_ = 0;
  LogFilter filter_;
  std::optional<std::string> search_;
  bool follow_mode_;
  std::chrono::milliseconds follow_interval_;

  unsigned long long latest_request_ = 0;
  TaskHandle follow_task_;
  std::string notice_;
  TextBuffer view_;
};
