#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "../text_buffer.h"

enum class Mode { Normal, LogTail, Watch, LogView };

const char* mode_name(Mode mode);

// Mode-local state plus the recurring background task of one interaction
// mode. An instance lives from its mode's entry to its mode's exit.
class ModeController {
 public:
  using UpdateCallback = std::function<void()>;

  explicit ModeController(UpdateCallback on_update)
      : on_update_(std::move(on_update)) {}
  virtual ~ModeController() = default;

  ModeController(const ModeController&) = delete;
  ModeController& operator=(const ModeController&) = delete;

  virtual Mode mode() const = 0;

  // Starts the background task. Called once, right after construction.
  virtual void start() = 0;

  /**
   * @brief Cancels the background task. Completions still in flight are
   * discarded when they arrive.
   */
  virtual void stop() = 0;

  virtual const TextBuffer& view() const = 0;

  // One-line mode summary for the toolbar.
  virtual std::string status_line() const = 0;

  bool alive() const { return *alive_; }

 protected:
  void set_alive(bool alive) { *alive_ = alive; }

  // Wraps a completion so it becomes a no-op once this controller stopped.
  template <typename Fn>
  auto while_alive(Fn fn) {
    return [alive = alive_, fn = std::move(fn)](auto&&... args) mutable {
      if (*alive) {
        fn(std::forward<decltype(args)>(args)...);
      }
    };
  }

  void notify_update() {
    if (on_update_) on_update_();
  }

 private:
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(false);
  UpdateCallback on_update_;
};
