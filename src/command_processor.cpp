#include "command_processor.h"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <stdexcept>

void CommandProcessor::submit(const std::string& line) {
  auto args = tokenize(line);
  if (args.empty()) {
    return;
  }

  if (history_.empty() || history_.back() != line) {
    history_.push_back(line);
  }
  history_pos_ = history_.size();

  session_.append_output(fmt::format("> {}\n", line));
  run(args);
}

void CommandProcessor::history_prev() {
  if (history_.empty()) return;
  if (history_pos_ > 0) history_pos_--;
  session_.input() = history_[history_pos_];
}

void CommandProcessor::history_next() {
  if (history_pos_ + 1 < history_.size()) {
    history_pos_++;
    session_.input() = history_[history_pos_];
  } else {
    history_pos_ = history_.size();
    session_.input().clear();
  }
}

std::vector<std::string> CommandProcessor::tokenize(const std::string& line) {
  std::vector<std::string> tokens;
  std::string current;
  bool in_token = false;
  char quote = 0;

  for (char c : line) {
    if (quote) {
      if (c == quote) {
        quote = 0;
      } else {
        current += c;
      }
    } else if (c == '"' || c == '\'') {
      quote = c;
      in_token = true;
    } else if (c == ' ' || c == '\t') {
      if (in_token) {
        tokens.push_back(current);
        current.clear();
        in_token = false;
      }
    } else {
      current += c;
      in_token = true;
    }
  }
  if (in_token) {
    tokens.push_back(current);
  }
  return tokens;
}

void CommandProcessor::run(const std::vector<std::string>& args) {
  const std::string& cmd = args[0];

  if (cmd == "help" || cmd == "?") {
    cmd_help();
  } else if (cmd == "exit" || cmd == "quit") {
    session_.quit();
  } else if (cmd == "clear") {
    session_.clear_output();
  } else if (cmd == "follow") {
    session_.set_follow_tail(!session_.follow_tail());
    session_.append_output(fmt::format(
        "Follow-tail {}\n", session_.follow_tail() ? "enabled" : "disabled"));
  } else if (cmd == "logs") {
    cmd_logs(args);
  } else if (cmd == "watch") {
    cmd_watch(args);
  } else if (std::find(QUERY_TARGETS.begin(), QUERY_TARGETS.end(), cmd) !=
             QUERY_TARGETS.end()) {
    cmd_query(cmd);
  } else {
    session_.append_output(fmt::format(
        "Unknown command: {}. Type 'help' for a list of commands.\n", cmd));
  }
}

void CommandProcessor::cmd_help() {
  session_.append_output(
      "Commands:\n"
      "  status | health | devices | mappings | channels\n"
      "                       query the bridge once\n"
      "  watch [TARGET] [--interval SECONDS]\n"
      "                       re-query TARGET periodically (default: status)\n"
      "  logs tail [--level LEVEL] [--logger LOGGER]\n"
      "                       stream new log lines\n"
      "  logs view [--level LEVEL] [--logger LOGGER] [--search PATTERN] "
      "[--follow]\n"
      "                       browse the log page by page\n"
      "  follow               toggle follow-tail (Ctrl+T)\n"
      "  clear                clear the output (Ctrl+L)\n"
      "  exit | quit          leave the console (Ctrl+D)\n");
}

void CommandProcessor::cmd_logs(const std::vector<std::string>& args) {
  if (args.size() < 2 || (args[1] != "tail" && args[1] != "view")) {
    session_.append_output("Usage: logs tail|view [options]\n");
    return;
  }

  ModeOptions options;
  if (!parse_options(args, 2, options)) {
    return;
  }
  if (args[1] == "tail") {
    if (options.search || options.follow || options.interval_s) {
      session_.append_output(
          "logs tail only accepts --level and --logger.\n");
      return;
    }
    session_.enter_mode(Mode::LogTail, options);
  } else {
    if (options.interval_s) {
      session_.append_output("logs view does not accept --interval.\n");
      return;
    }
    session_.enter_mode(Mode::LogView, options);
  }
}

void CommandProcessor::cmd_watch(const std::vector<std::string>& args) {
  ModeOptions options;
  size_t first = 1;
  if (args.size() > 1 && args[1].rfind("--", 0) != 0) {
    options.watch_target = args[1];
    first = 2;
  }
  if (std::find(QUERY_TARGETS.begin(), QUERY_TARGETS.end(),
                options.watch_target) == QUERY_TARGETS.end()) {
    session_.append_output(
        fmt::format("Unknown watch target: {}\n", options.watch_target));
    return;
  }
  if (!parse_options(args, first, options)) {
    return;
  }
  session_.enter_mode(Mode::Watch, options);
}

void CommandProcessor::cmd_query(const std::string& target) {
  ConsoleSession* session = &session_;
  session_.status_source().query(
      target, [session, target](const ApiResult<StatusSnapshot>& result) {
        if (result.ok()) {
          session->append_output(format_snapshot(result.value()));
        } else {
          session->append_output(
              fmt::format("[Error querying {}: {}]\n", target, result.error()));
        }
      });
}

bool CommandProcessor::parse_options(const std::vector<std::string>& args,
                                     size_t first, ModeOptions& options) {
  for (size_t i = first; i < args.size(); ++i) {
    const std::string& opt = args[i];
    if (opt == "--follow") {
      options.follow = true;
      continue;
    }
    if (opt != "--level" && opt != "--logger" && opt != "--search" &&
        opt != "--interval") {
      session_.append_output(fmt::format("Unknown option: {}\n", opt));
      return false;
    }
    if (i + 1 >= args.size()) {
      session_.append_output(fmt::format("Option {} needs a value.\n", opt));
      return false;
    }
    const std::string& value = args[++i];

    if (opt == "--level") {
      std::string level = value;
      std::transform(level.begin(), level.end(), level.begin(),
                     [](unsigned char c) { return std::toupper(c); });
      if (!LogViewController::is_cycle_level(level)) {
        session_.append_output(fmt::format(
            "Unknown level: {} (use DEBUG, INFO, WARNING, ERROR or "
            "CRITICAL)\n",
            value));
        return false;
      }
      options.filter.level = level;
    } else if (opt == "--logger") {
      options.filter.logger = value;
    } else if (opt == "--search") {
      options.search = value;
    } else {
      double interval_s = 0;
      try {
        interval_s = std::stod(value);
      } catch (const std::exception&) {
        session_.append_output(
            fmt::format("Invalid interval: {}\n", value));
        return false;
      }
      if (!std::isfinite(interval_s)) {
        session_.append_output(
            fmt::format("Invalid interval: {}\n", value));
        return false;
      }
      options.interval_s = interval_s;
    }
  }
  return true;
}
