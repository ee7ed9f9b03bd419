#pragma once

#include <string>
#include <vector>

#include "console_session.h"

// Interprets lines submitted in normal mode.
class CommandProcessor {
 public:
  explicit CommandProcessor(ConsoleSession& session) : session_(session) {}

  void submit(const std::string& line);

  // Up/Down recall of earlier lines into the input.
  void history_prev();
  void history_next();
  const std::vector<std::string>& history() const { return history_; }

  static inline const std::vector<std::string> QUERY_TARGETS = {
      "status", "health", "devices", "mappings", "channels"};

  static std::vector<std::string> tokenize(const std::string& line);

 private:
  void run(const std::vector<std::string>& args);
  void cmd_help();
  void cmd_logs(const std::vector<std::string>& args);
  void cmd_watch(const std::vector<std::string>& args);
  void cmd_query(const std::string& target);

  /**
   * @return false after printing an error if an option is unknown or
   * lacks its value.
   */
  bool parse_options(const std::vector<std::string>& args, size_t first,
                     ModeOptions& options);

  ConsoleSession& session_;
  std::vector<std::string> history_;
  size_t history_pos_ = 0;
};
