#include "log_console.h"

using namespace ftxui;

Component LogConsole(int msg_count) {
  return Renderer([msg_count] {
    Elements lines;
    for (const auto& message : LogStreamBuffer::get_messages(msg_count)) {
      Element line = text(message);
      if (message.find("[Err]") != std::string::npos) {
        line = line | color(Color::Red);
      }
      lines.push_back(line);
    }
    return window(text("Messages"),
                  vbox(lines) | size(HEIGHT, GREATER_THAN, 2) |
                      size(HEIGHT, LESS_THAN, msg_count + 2));
  });
}
