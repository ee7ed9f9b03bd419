#pragma once

#include <string>
#include <vector>

#include "api.h"
#include "nlohmann/json.hpp"

// Decoders for the bridge's REST payloads. All of them throw
// nlohmann::json::exception on payloads of the wrong shape.
namespace ApiJson {

LogLine parse_log_line(const nlohmann::json& entry);

/**
 * @brief Accepts either {"logs": [...]} or a bare array.
 */
std::vector<LogLine> parse_log_lines(const nlohmann::json& data);

/**
 * @brief Decodes {"logs": [...], "total": N} for the page that was asked
 * for with `query`.
 */
LogPage parse_log_page(const nlohmann::json& data, const LogPageQuery& query);

StatusSnapshot parse_snapshot(const std::string& target,
                              const nlohmann::json& data);

}  // namespace ApiJson
