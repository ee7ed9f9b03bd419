#include "mode_controller.h"

const char* mode_name(Mode mode) {
  switch (mode) {
    case Mode::Normal:
      return "normal";
    case Mode::LogTail:
      return "log tail";
    case Mode::Watch:
      return "watch";
    case Mode::LogView:
      return "log view";
  }
  return "unknown";
}
