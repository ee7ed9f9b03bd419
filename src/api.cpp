#include "api.h"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>

static std::string to_upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

bool LogFilter::matches(const LogLine& line) const {
  if (level && to_upper(*level) != to_upper(line.level)) {
    return false;
  }
  if (logger && line.logger.compare(0, logger->size(), *logger) != 0) {
    return false;
  }
  return true;
}

std::string format_log_line(const LogLine& line) {
  return fmt::format("{} {:<8} {}: {}", line.timestamp, line.level,
                     line.logger, line.message);
}

std::string format_snapshot(const StatusSnapshot& snapshot) {
  size_t key_width = 0;
  for (const auto& [key, value] : snapshot.rows) {
    key_width = std::max(key_width, key.size());
  }

  std::string out = snapshot.title + "\n\n";
  for (const auto& [key, value] : snapshot.rows) {
    out += fmt::format("  {:<{}}  {}\n", key, key_width, value);
  }
  if (snapshot.rows.empty()) {
    out += "  (no data)\n";
  }
  return out;
}
