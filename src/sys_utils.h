#pragma once
#include <filesystem>
#include <string>

namespace SysUtils {

#ifdef _WIN32
using path_string_t = std::wstring;
#else
using path_string_t = std::string;
#endif

/**
 * @brief Per-user directory for config.json and the log file. Honors
 * $XDG_CONFIG_HOME.
 * @return empty path if it cannot be determined.
 */
std::filesystem::path get_user_config_path();

#ifdef _WIN32
std::string make_utf8_from_wstring(const std::wstring& wstr);
std::wstring make_wstring_from_utf8(const std::string& utf8);
#endif

/**
 * @brief Use this to convert utf8 paths to OS specific paths.
 */
path_string_t make_path_string(const std::string& utf8_path);

/**
 * @return true if both stdin and stdout are attached to a terminal.
 */
bool is_interactive_terminal();
}  // namespace SysUtils
