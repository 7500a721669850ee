#pragma once
/*
 * App
 *
 * Purpose: owns the counter state and runs the draw / read / handle loop.
 * Render: view() builds the widget tree as a pure function of state;
 * render() rasterizes it (IWidget), so tests need no real terminal.
 * Errors: counter bounds are returned as CounterError values and reported on
 * the status line; terminal/input failures leave run() as LoopError.
 * handle_event() throws only on allocation failure, which run() reports with
 * LoopPhase::HandleEvent. Keys are ignored once the exit flag is set.
 */
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include "errors.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "key_registry.hpp"
#include "widgets.hpp"

class App : public IWidget {
public:
  static constexpr uint8_t kCounterMax = 2;
  static constexpr const char* kTitle = " Bcachefs TUI ";

  App() : keys_(KeyRegistry::defaults()) {}

  void run(ITerminal& term, IInputSource& input);
  void handle_event(const Event& ev);
  std::optional<CounterError> handle_key(int key);

  Paragraph view() const;
  void render(const Rect& area, ITerminal& term) const override;

  uint8_t counter() const { return counter_; }
  bool exited() const { return exit_; }
  const std::string& status() const { return status_; }
  void set_status(std::string msg) { status_ = std::move(msg); }

private:
  std::optional<CounterError> apply(Action action);
  std::optional<CounterError> increment();
  std::optional<CounterError> decrement();

  uint8_t counter_ = 0;
  bool exit_ = false;
  std::string status_;
  KeyRegistry keys_;
};
