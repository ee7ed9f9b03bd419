#include "api_json.h"

#include <algorithm>

using json = nlohmann::json;

namespace {
std::string scalar_text(const json& value) {
  if (value.is_string()) return value.get<std::string>();
  if (value.is_null()) return "-";
  return value.dump();
}
}  // namespace

LogLine ApiJson::parse_log_line(const json& entry) {
  LogLine line;
  line.seq = entry.value("seq", 0ULL);
  line.timestamp = entry.value("timestamp", std::string());
  line.level = entry.value("level", std::string("INFO"));
  line.logger = entry.value("logger", std::string());
  line.message = entry.value("message", std::string());
  return line;
}

std::vector<LogLine> ApiJson::parse_log_lines(const json& data) {
  const json& entries = data.is_array() ? data : data.at("logs");
  std::vector<LogLine> lines;
  lines.reserve(entries.size());
  for (const auto& entry : entries) {
    lines.push_back(parse_log_line(entry));
  }
  return lines;
}

LogPage ApiJson::parse_log_page(const json& data, const LogPageQuery& query) {
  LogPage page;
  page.lines = parse_log_lines(data);

  int page_size = std::max(1, query.page_size);
  long long total = static_cast<long long>(page.lines.size());
  if (data.is_object()) {
    total = data.value("total", total);
  }
  page.total_pages = static_cast<int>((total + page_size - 1) / page_size);
  page.page = query.page;
  page.has_prev = query.page > 0;
  page.has_next = query.page + 1 < page.total_pages;
  return page;
}

StatusSnapshot ApiJson::parse_snapshot(const std::string& target,
                                       const json& data) {
  StatusSnapshot snapshot;
  snapshot.title = target;

  if (data.is_object()) {
    for (const auto& [key, value] : data.items()) {
      snapshot.rows.emplace_back(key, scalar_text(value));
    }
  } else if (data.is_array()) {
    snapshot.title = target + " (" + std::to_string(data.size()) + ")";
    for (size_t i = 0; i < data.size(); ++i) {
      const json& item = data[i];
      std::string key = std::to_string(i);
      if (item.is_object() && item.contains("id")) {
        key = scalar_text(item["id"]);
      }
      snapshot.rows.emplace_back(key, scalar_text(item));
    }
  } else {
    snapshot.rows.emplace_back("value", scalar_text(data));
  }
  return snapshot;
}
