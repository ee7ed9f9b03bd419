#pragma once

#include <cstddef>
#include <string>

struct ConsoleConfig {
  std::string server_url = "http://127.0.0.1:8000";
  double request_timeout_s = 5.0;
  double watch_interval_s = 2.0;       // in seconds, >= 0.5
  double tail_poll_interval_s = 1.0;   // in seconds
  int log_view_page_size = 50;
  double log_view_follow_interval_s = 2.0;
  bool follow_tail = true;
  size_t max_output_chars = 200000;  // 0 keeps everything
};

class ConfigManager {
 public:
  explicit ConfigManager(const std::string &file_path);

  /**
   * @brief Missing or malformed files leave the defaults in place.
   * @return true if the file existed and parsed.
   */
  bool load();

  /**
   * @return true on success
   */
  bool save() const;

  const ConsoleConfig &get() const { return config_; }
  ConsoleConfig &get() { return config_; }
  const std::string &get_file_path() const { return file_path_; }

 private:
  std::string file_path_;
  ConsoleConfig config_;
};
