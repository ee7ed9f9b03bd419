#include "key_dispatch.h"

#include <fmt/core.h>

#include <stdexcept>

#include "console_session.h"

KeyGuard KeyDispatchTable::any_mode() {
  return [](Mode) { return true; };
}

KeyGuard KeyDispatchTable::in_mode(Mode mode) {
  return [mode](Mode current) { return current == mode; };
}

void KeyDispatchTable::add(const ftxui::Event& key, KeyGuard guard,
                           KeyHandler handler, std::string description) {
  // guards only read the mode, so trying every mode decides overlap
  for (const auto& existing : bindings_) {
    if (!(existing.key == key)) continue;
    for (Mode mode : ALL_MODES) {
      if (existing.guard(mode) && guard(mode)) {
        throw std::logic_error(fmt::format(
            "Key binding '{}' overlaps '{}' in {} mode", description,
            existing.description, mode_name(mode)));
      }
    }
  }
  bindings_.push_back(
      Binding{key, std::move(guard), std::move(handler), std::move(description)});
}

bool KeyDispatchTable::dispatch(const ftxui::Event& event,
                                ConsoleSession& session) const {
  const Binding* binding = find(event, session.mode());
  if (binding == nullptr) {
    return false;
  }
  binding->handler(session);
  return true;
}

const KeyDispatchTable::Binding* KeyDispatchTable::find(
    const ftxui::Event& event, Mode mode) const {
  for (const auto& binding : bindings_) {
    if (binding.key == event && binding.guard(mode)) {
      return &binding;
    }
  }
  return nullptr;
}

std::vector<const KeyDispatchTable::Binding*> KeyDispatchTable::bindings_for(
    Mode mode) const {
  std::vector<const Binding*> result;
  for (const auto& binding : bindings_) {
    if (binding.guard(mode)) {
      result.push_back(&binding);
    }
  }
  return result;
}
