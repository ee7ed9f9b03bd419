#include "keybindings.h"

#include <fmt/core.h>

#include "console_session.h"

using namespace ftxui;

namespace {
const Event CTRL_C = Event::Special("\x03");
const Event CTRL_D = Event::Special("\x04");
const Event CTRL_L = Event::Special("\x0C");
const Event CTRL_T = Event::Special("\x14");

void add_global_bindings(KeyDispatchTable& kb) {
  const KeyGuard any = KeyDispatchTable::any_mode();

  kb.add(CTRL_C, any, [](ConsoleSession& s) {
    if (!s.input().empty()) {
      s.input().clear();
      s.request_redraw();
    } else {
      s.append_output("Use 'exit' or Ctrl+D to quit.\n");
    }
  }, "clear input");

  kb.add(CTRL_D, any, [](ConsoleSession& s) { s.quit(); }, "quit");

  kb.add(CTRL_L, any, [](ConsoleSession& s) { s.clear_output(); },
         "clear output");

  kb.add(CTRL_T, any, [](ConsoleSession& s) {
    s.set_follow_tail(!s.follow_tail());
    s.append_output(fmt::format("Follow-tail {}\n",
                                s.follow_tail() ? "enabled" : "disabled"));
  }, "toggle follow-tail");
}

void add_normal_bindings(KeyDispatchTable& kb, CommandProcessor& commands,
                         const std::function<int()>& page_lines) {
  const KeyGuard normal = KeyDispatchTable::in_mode(Mode::Normal);

  kb.add(Event::PageUp, normal, [page_lines](ConsoleSession& s) {
    s.scroll(ScrollDirection::Up, page_lines());
  }, "scroll up");

  kb.add(Event::PageDown, normal, [page_lines](ConsoleSession& s) {
    s.scroll(ScrollDirection::Down, page_lines());
  }, "scroll down");

  kb.add(Event::Return, normal, [&commands](ConsoleSession& s) {
    std::string line = s.input();
    s.input().clear();
    commands.submit(line);
  }, "submit");

  kb.add(Event::ArrowUp, normal,
         [&commands](ConsoleSession&) { commands.history_prev(); },
         "history back");
  kb.add(Event::ArrowDown, normal,
         [&commands](ConsoleSession&) { commands.history_next(); },
         "history forward");
}

void add_log_tail_bindings(KeyDispatchTable& kb,
                           const std::function<int()>& page_lines) {
  const KeyGuard tail = KeyDispatchTable::in_mode(Mode::LogTail);

  kb.add(Event::Escape, tail, [](ConsoleSession& s) { s.exit_mode(); },
         "leave log tail");
  kb.add(Event::Character('q'), tail, [](ConsoleSession& s) { s.exit_mode(); },
         "leave log tail");

  kb.add(Event::End, tail, [](ConsoleSession& s) {
    if (auto* c = s.log_tail_controller()) {
      c->enable_follow_tail();
      s.request_redraw();
    }
  }, "follow log tail");

  kb.add(Event::Character('f'), tail, [](ConsoleSession& s) {
    if (auto* c = s.log_tail_controller()) c->show_filter_notice();
  }, "log tail filter");

  kb.add(Event::PageUp, tail, [page_lines](ConsoleSession& s) {
    if (auto* c = s.log_tail_controller()) {
      c->scroll(ScrollDirection::Up, page_lines());
      s.request_redraw();
    }
  }, "scroll log tail up");

  kb.add(Event::PageDown, tail, [page_lines](ConsoleSession& s) {
    if (auto* c = s.log_tail_controller()) {
      c->scroll(ScrollDirection::Down, page_lines());
      s.request_redraw();
    }
  }, "scroll log tail down");
}

void add_watch_bindings(KeyDispatchTable& kb) {
  const KeyGuard watch = KeyDispatchTable::in_mode(Mode::Watch);

  kb.add(Event::Escape, watch, [](ConsoleSession& s) { s.exit_mode(); },
         "leave watch");
  kb.add(Event::Character('q'), watch,
         [](ConsoleSession& s) { s.exit_mode(); }, "leave watch");

  kb.add(Event::Character('+'), watch, [](ConsoleSession& s) {
    if (auto* c = s.watch_controller()) c->faster();
  }, "watch faster");

  kb.add(Event::Character('-'), watch, [](ConsoleSession& s) {
    if (auto* c = s.watch_controller()) c->slower();
  }, "watch slower");
}

void add_log_view_bindings(KeyDispatchTable& kb) {
  const KeyGuard view = KeyDispatchTable::in_mode(Mode::LogView);

  kb.add(Event::Escape, view, [](ConsoleSession& s) { s.exit_mode(); },
         "leave log view");
  kb.add(Event::Character('q'), view,
         [](ConsoleSession& s) { s.exit_mode(); }, "leave log view");

  auto page = [](PageTarget target) {
    return [target](ConsoleSession& s) {
      if (auto* c = s.log_view_controller()) {
        c->navigate_page(target);
        c->refresh();
      }
    };
  };
  kb.add(Event::PageUp, view, page(PageTarget::Prev), "previous page");
  kb.add(Event::PageDown, view, page(PageTarget::Next), "next page");
  kb.add(Event::Home, view, page(PageTarget::First), "first page");
  kb.add(Event::End, view, page(PageTarget::Last), "last page");

  kb.add(Event::Character('l'), view, [](ConsoleSession& s) {
    if (auto* c = s.log_view_controller()) {
      c->cycle_level_filter();
      c->refresh();
    }
  }, "cycle level");

  kb.add(Event::Character('c'), view, [](ConsoleSession& s) {
    if (auto* c = s.log_view_controller()) {
      c->set_logger_filter(std::nullopt);
      c->refresh();
    }
  }, "clear logger filter");

  kb.add(Event::Character('r'), view, [](ConsoleSession& s) {
    if (auto* c = s.log_view_controller()) c->refresh();
  }, "refresh");

  kb.add(Event::Character(' '), view, [](ConsoleSession& s) {
    if (auto* c = s.log_view_controller()) {
      c->toggle_follow_mode();
      c->refresh();
    }
  }, "toggle follow");

  // no input dialogs yet
  auto notice = [](const std::string& text) {
    return [text](ConsoleSession& s) {
      if (auto* c = s.log_view_controller()) c->show_notice(text);
    };
  };
  kb.add(Event::Character('f'), view,
         notice(LogViewController::FILTER_NOTICE), "logger filter");
  kb.add(Event::Character('/'), view,
         notice(LogViewController::SEARCH_NOTICE), "search");
  kb.add(Event::Character('?'), view, notice(LogViewController::HELP_NOTICE),
         "help");
}
}  // namespace

KeyDispatchTable create_key_bindings(CommandProcessor& commands,
                                     std::function<int()> page_lines) {
  KeyDispatchTable kb;
  add_global_bindings(kb);
  add_normal_bindings(kb, commands, page_lines);
  add_log_tail_bindings(kb, page_lines);
  add_watch_bindings(kb);
  add_log_view_bindings(kb);
  return kb;
}
