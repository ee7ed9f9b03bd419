#include "console_view.h"

#include <fmt/core.h>

#include <algorithm>

using namespace ftxui;

Element render_buffer(const TextBuffer& buffer) {
  auto lines = buffer.lines();
  if (lines.empty()) {
    return text("");
  }

  size_t cursor_line = std::min(buffer.cursor_line(), lines.size() - 1);
  Elements elements;
  elements.reserve(lines.size());
  for (size_t i = 0; i < lines.size(); ++i) {
    Element line = text(lines[i]);
    if (lines[i].rfind("[", 0) == 0 &&
        lines[i].find("not yet implemented") != std::string::npos) {
      line = line | color(Color::Yellow);
    } else if (lines[i].rfind("[Error", 0) == 0 ||
               lines[i].rfind("[Log tail error", 0) == 0) {
      line = line | color(Color::Red);
    }
    if (i == cursor_line) {
      line = line | focus;
    }
    elements.push_back(line);
  }
  return vbox(elements);
}

static Element toolbar(const ConsoleSession& session) {
  if (const ModeController* controller = session.active_controller()) {
    return text(controller->status_line()) | inverted;
  }
  return text(fmt::format(
             "NORMAL | follow-tail: {} | PgUp/PgDn scroll, Ctrl+T follow, "
             "Ctrl+L clear, Ctrl+D quit",
             session.follow_tail() ? "on" : "off")) |
         inverted;
}

Component ConsoleView(ConsoleSession& session, const KeyDispatchTable& keys) {
  InputOption input_option;
  input_option.multiline = false;
  auto input = Input(&session.input(), "type 'help' for commands",
                     input_option);

  auto input_with_keys = CatchEvent(input, [&session, &keys](Event event) {
    return keys.dispatch(event, session);
  });

  return Renderer(input_with_keys, [&session, input] {
    std::string title = session.mode() == Mode::Normal
                            ? std::string("Output")
                            : fmt::format("Output [{}]", mode_name(session.mode()));

    return vbox({
        window(text(title),
               render_buffer(session.visible_buffer()) | yframe | flex) |
            flex,
        toolbar(session),
        hbox({
            text("> ") | bold,
            input->Render() | flex,
        }),
    });
  });
}
