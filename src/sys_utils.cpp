#include "sys_utils.h"

#include <cstdio>
#include <cstdlib>
#include <string>

#ifdef _WIN32
#include <io.h>
#include <windows.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace {
const char* APP_DIR_NAME = "dmx-console";
}

std::filesystem::path SysUtils::get_user_config_path() {
#ifdef _WIN32
  const wchar_t* appdata = _wgetenv(L"APPDATA");
  if (appdata) {
    return std::filesystem::path(appdata) / APP_DIR_NAME;
  }
  return std::filesystem::path();
#else
  const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config != nullptr && xdg_config[0] != '\0') {
    return std::filesystem::path(xdg_config) / APP_DIR_NAME;
  }

  const char* home = std::getenv("HOME");
  if (home == nullptr || home[0] == '\0') {
    struct passwd* pw = getpwuid(geteuid());
    if (pw == nullptr) {
      return std::filesystem::path();
    }
    home = pw->pw_dir;
  }
  return std::filesystem::path(home) / ".config" / APP_DIR_NAME;
#endif
}

#ifdef _WIN32
std::string SysUtils::make_utf8_from_wstring(const std::wstring& wstr) {
  if (wstr.empty()) {
    return std::string();
  }
  int size_needed = WideCharToMultiByte(CP_UTF8, 0, wstr.data(),
                                        (int)wstr.size(), NULL, 0, NULL, NULL);
  std::string str_to(size_needed, 0);
  WideCharToMultiByte(CP_UTF8, 0, wstr.data(), (int)wstr.size(), &str_to[0],
                      size_needed, NULL, NULL);
  return str_to;
}
std::wstring SysUtils::make_wstring_from_utf8(const std::string& utf8) {
  if (utf8.empty()) {
    return std::wstring();
  }
  int size_needed = MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(),
                                        (int)utf8.size(), nullptr, 0);
  std::wstring wstr_to(size_needed, 0);
  MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), (int)utf8.size(), &wstr_to[0],
                      size_needed);
  return wstr_to;
}
#endif

SysUtils::path_string_t SysUtils::make_path_string(
    const std::string& utf8_path) {
#ifdef _WIN32
  return make_wstring_from_utf8(utf8_path);
#else
  return utf8_path;
#endif
}

bool SysUtils::is_interactive_terminal() {
#ifdef _WIN32
  return _isatty(_fileno(stdin)) && _isatty(_fileno(stdout));
#else
  return isatty(STDIN_FILENO) && isatty(STDOUT_FILENO);
#endif
}
