#include "dmxconsole.h"

#include <fmt/core.h>

#include <algorithm>
#include <fstream>
#include <iostream>

#include "nlohmann/json.hpp"
#include "sys_utils.h"

using json = nlohmann::json;

ConfigManager::ConfigManager(const std::string &file_path)
    : file_path_(file_path) {}

bool ConfigManager::load() {
  std::clog << fmt::format("Loading config from {}.", file_path_) << std::endl;

  std::ifstream file(SysUtils::make_path_string(file_path_));
  if (!file.is_open()) {
    std::clog << "Config file not found. Using defaults." << std::endl;
    return false;
  }

  json data;
  try {
    data = json::parse(file);
  } catch (const json::exception &e) {
    std::cerr << fmt::format(
                     "Error parsing config file {}. Using defaults. "
                     "Details: {}",
                     file_path_, e.what())
              << std::endl;
    return false;
  }

  ConsoleConfig defaults;
  try {
    config_.server_url = data.value("server_url", defaults.server_url);
    config_.request_timeout_s = std::max(
        0.1, data.value("request_timeout_s", defaults.request_timeout_s));
    config_.watch_interval_s = std::max(
        0.5, data.value("watch_interval_s", defaults.watch_interval_s));
    config_.tail_poll_interval_s = std::max(
        0.1, data.value("tail_poll_interval_s", defaults.tail_poll_interval_s));
    config_.log_view_page_size = std::clamp(
        data.value("log_view_page_size", defaults.log_view_page_size), 1, 1000);
    config_.log_view_follow_interval_s =
        std::max(0.5, data.value("log_view_follow_interval_s",
                                 defaults.log_view_follow_interval_s));
    config_.follow_tail = data.value("follow_tail", defaults.follow_tail);
    config_.max_output_chars =
        data.value("max_output_chars", defaults.max_output_chars);
  } catch (const json::type_error &e) {
    std::cerr << fmt::format(
                     "Config file {} has a value of the wrong type. Using "
                     "defaults. Details: {}",
                     file_path_, e.what())
              << std::endl;
    config_ = defaults;
    return false;
  }

  while (!config_.server_url.empty() && config_.server_url.back() == '/') {
    config_.server_url.pop_back();
  }

  std::clog << fmt::format("Config loaded. Server is {}.", config_.server_url)
            << std::endl;
  return true;
}

bool ConfigManager::save() const {
  json data;
  data["server_url"] = config_.server_url;
  data["request_timeout_s"] = config_.request_timeout_s;
  data["watch_interval_s"] = config_.watch_interval_s;
  data["tail_poll_interval_s"] = config_.tail_poll_interval_s;
  data["log_view_page_size"] = config_.log_view_page_size;
  data["log_view_follow_interval_s"] = config_.log_view_follow_interval_s;
  data["follow_tail"] = config_.follow_tail;
  data["max_output_chars"] = config_.max_output_chars;

  std::ofstream outfile(SysUtils::make_path_string(file_path_));
  if (!outfile) {
    std::cerr << fmt::format("Failed to open {}.", file_path_) << std::endl;
    return false;
  }
  outfile << data.dump(4);
  std::clog << fmt::format("Config saved to {}.", file_path_) << std::endl;
  return true;
}
