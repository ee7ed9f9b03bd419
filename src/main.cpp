#include <fmt/chrono.h>
#include <fmt/core.h>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <ftxui/component/component.hpp>
#include <ftxui/component/loop.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/screen/terminal.hpp>
#include <iostream>
#include <thread>

#include "command_processor.h"
#include "components/console_view.h"
#include "components/log_console.h"
#include "console_session.h"
#include "dmxconsole.h"
#include "http_api_client.h"
#include "keybindings.h"
#include "scheduler.h"
#include "stream_redirect.h"
#include "sys_utils.h"

using namespace ftxui;

#ifndef DMXCONSOLE_VERSION  // defined in CMake
#define DMXCONSOLE_VERSION "unknown"
#endif

static void print_usage(const char* argv0) {
  std::cout << fmt::format(
      "Usage: {} [--server URL] [--config PATH]\n"
      "\n"
      "Interactive console for the DMX LAN bridge.\n"
      "\n"
      "  --server URL    bridge REST endpoint (overrides config.json)\n"
      "  --config PATH   config file to use\n"
      "  --version       print the version and exit\n"
      "  --help          show this help\n",
      argv0);
}

int main(int argc, char* argv[]) {
  std::string server_override;
  std::string config_override;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "--version") {
      std::cout << fmt::format("dmx-console {}", DMXCONSOLE_VERSION)
                << std::endl;
      return 0;
    } else if ((arg == "--server" || arg == "--config") && i + 1 < argc) {
      (arg == "--server" ? server_override : config_override) = argv[++i];
    } else {
      std::cerr << fmt::format("Unknown argument: {}", arg) << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }

  if (!SysUtils::is_interactive_terminal()) {
    std::cerr << "Fatal: dmx-console needs an interactive terminal."
              << std::endl;
    return 1;
  }

  std::filesystem::path config_dir = SysUtils::get_user_config_path();
  if (config_dir.empty()) {
    std::cerr << "Fatal: Cannot determine user config directory." << std::endl;
    return 1;
  }

  std::error_code ec;
  std::filesystem::create_directories(config_dir, ec);
  if (ec) {
    std::cerr << fmt::format("Fatal: Cannot create {}: {}", config_dir.string(),
                             ec.message())
              << std::endl;
    return 1;
  }
  std::filesystem::path config_path =
      config_override.empty() ? config_dir / "config.json"
                              : std::filesystem::path(config_override);
  std::filesystem::path log_path = config_dir / "dmx-console.log";

  // ---------------------------------------------------------------------------
  // Redirect logs to file
  // ---------------------------------------------------------------------------

  std::ofstream log_file(SysUtils::make_path_string(log_path.string()),
                         std::ios::app);
  if (log_file.is_open()) {
    log_file << fmt::format("\n--- Session Started on {:%Y-%m-%d %X} ---\n",
                            fmt::localtime(std::time(nullptr)))
             << std::endl;
  }
  LogStreamBuffer clog_log_buffer("[Msg] ", log_file);
  LogStreamBuffer cerr_log_buffer("[Err] ", log_file);
  StreamRedirector redirect_clog(std::clog, &clog_log_buffer);
  StreamRedirector redirect_cerr(std::cerr, &cerr_log_buffer);

  if (!log_file.is_open()) {
    std::cerr << "Failed to open log. File logging will be disabled."
              << std::endl;
  }

  // ---------------------------------------------------------------------------
  // Load config; connect to the bridge
  // ---------------------------------------------------------------------------

  ConfigManager cm(config_path.string());
  if (!cm.load() && !std::filesystem::exists(config_path)) {
    cm.save();
  }
  if (!server_override.empty()) {
    cm.get().server_url = server_override;
  }

  Scheduler scheduler;
  std::unique_ptr<HttpApiClient> api;
  try {
    api = std::make_unique<HttpApiClient>(cm.get(), scheduler);
  } catch (const std::exception& e) {
    // cerr goes to the log file now, so tell the terminal as well
    std::cerr << "Fatal: Cannot create API client: " << e.what() << std::endl;
    std::cout << "Fatal: Cannot create API client: " << e.what() << std::endl;
    return 1;
  }

  // ---------------------------------------------------------------------------
  // FTXUI
  // ---------------------------------------------------------------------------

  auto screen = ScreenInteractive::Fullscreen();
  screen.ForceHandleCtrlC(false);

  ConsoleSession session(cm.get(), scheduler, *api, *api);
  CommandProcessor commands(session);
  KeyDispatchTable keys = create_key_bindings(
      commands, [] { return std::max(1, Terminal::Size().dimy - 4); });

  session.set_redraw_callback([&screen] { screen.RequestAnimationFrame(); });
  session.set_quit_callback([&screen] { screen.ExitLoopClosure()(); });

  Component console_view = ConsoleView(session, keys);
  Component log_console = LogConsole();

  auto main_renderer = Renderer(console_view, [&] {
    std::string title_text =
        fmt::format("dmx-console {} | {}", DMXCONSOLE_VERSION,
                    cm.get().server_url);
    return vbox({
               text(title_text) | bold | hcenter,
               separator(),
               console_view->Render() | flex,
               log_console->Render(),
           }) |
           border;
  });

  session.append_output(fmt::format(
      "dmx-console {} connected to {}.\nType 'help' for commands, Ctrl+D to "
      "quit.\n",
      DMXCONSOLE_VERSION, cm.get().server_url));
  std::clog << fmt::format("Using server {}.", cm.get().server_url)
            << std::endl;

  Loop loop(&screen, main_renderer);
  while (!loop.HasQuitted()) {
    scheduler.run_pending();
    screen.RequestAnimationFrame();
    loop.RunOnce();
    std::this_thread::sleep_for(std::chrono::milliseconds(1000 / 60));
  }

  session.exit_mode();
  std::clog << "Session closed." << std::endl;
  return 0;
}
