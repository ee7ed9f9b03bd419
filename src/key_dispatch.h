#pragma once

#include <array>
#include <functional>
#include <ftxui/component/event.hpp>
#include <string>
#include <vector>

#include "modes/mode_controller.h"

class ConsoleSession;

// Guards see only a snapshot of the mode and must not have side effects.
using KeyGuard = std::function<bool(Mode)>;
using KeyHandler = std::function<void(ConsoleSession&)>;

inline constexpr std::array<Mode, 4> ALL_MODES = {Mode::Normal, Mode::LogTail,
                                                  Mode::Watch, Mode::LogView};

class KeyDispatchTable {
 public:
  struct Binding {
    ftxui::Event key;
    KeyGuard guard;
    KeyHandler handler;
    std::string description;
  };

  static KeyGuard any_mode();
  static KeyGuard in_mode(Mode mode);

  /**
   * @brief Registers a binding after all earlier ones.
   * @throw std::logic_error if an existing binding for the same key can fire
   * in a mode where this one can.
   */
  void add(const ftxui::Event& key, KeyGuard guard, KeyHandler handler,
           std::string description = "");

  /**
   * @brief Runs the first binding whose key matches and whose guard holds.
   * @return false if nothing matched, so the key goes to text input.
   */
  bool dispatch(const ftxui::Event& event, ConsoleSession& session) const;

  const Binding* find(const ftxui::Event& event, Mode mode) const;
  std::vector<const Binding*> bindings_for(Mode mode) const;
  size_t size() const { return bindings_.size(); }

 private:
  std::vector<Binding> bindings_;
};
