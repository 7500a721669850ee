#include "app.hpp"
#include "headless_terminal.hpp"
#include "logging.hpp"
#include <cassert>
#include <initializer_list>
#include <string>

static void increment_saturates_at_two() {
  App app;
  for (int presses = 1; presses <= 5; ++presses) {
    auto err = app.handle_key('k');
    if (presses <= 2) {
      assert(!err);
      assert(app.counter() == presses);
    } else {
      assert(err && *err == CounterError::Overflow);
      assert(std::string(to_message(*err)) == "counter overflow");
      assert(app.counter() == 2);
    }
  }
  assert(!app.exited());
}

static void decrement_stops_at_zero() {
  App app;
  app.handle_key('k');
  app.handle_key('k');
  assert(!app.handle_key('j'));
  assert(app.counter() == 1);
  assert(!app.handle_key('j'));
  assert(app.counter() == 0);
  auto err = app.handle_key('j');
  assert(err && *err == CounterError::Underflow);
  assert(std::string(to_message(*err)) == "counter underflow");
  assert(app.counter() == 0);
  assert(!app.exited());
}

static void quit_keeps_counter() {
  App app;
  app.handle_key('k');
  assert(!app.handle_key('q'));
  assert(app.exited());
  assert(app.counter() == 1);
}

static void other_keys_are_noops() {
  App app;
  for (int key : std::initializer_list<int>{'a', 'J', 'K', 'Q', ' ', 27, 3, 0x102}) {
    assert(!app.handle_key(key));
  }
  assert(app.counter() == 0);
  assert(!app.exited());
}

static void only_presses_dispatch() {
  App app;
  app.handle_event(Event{EventKind::KeyRepeat, 'k'});
  app.handle_event(Event{EventKind::KeyRelease, 'k'});
  app.handle_event(Event{EventKind::Resize, 'q'});
  app.handle_event(Event{EventKind::Other, 'q'});
  assert(app.counter() == 0);
  assert(!app.exited());
  app.handle_event(Event::press('k'));
  assert(app.counter() == 1);
}

static void status_clears_on_success() {
  App app;
  app.handle_event(Event::press('j'));
  assert(app.status() == "counter underflow");
  app.handle_event(Event::press('x'));
  assert(app.status() == "counter underflow");
  app.handle_event(Event::press('k'));
  assert(app.status().empty());
}

static void end_to_end_session() {
  App app;
  HeadlessTerminal term(4, 50);
  ScriptedInput input;
  input.push_keys("kkkjjjq");
  input.push_keys("k"); // never read
  app.run(term, input);
  assert(app.exited());
  assert(app.counter() == 0);
  assert(app.status() == "counter underflow");
  assert(term.frames() == 7);
  assert(!input.exhausted());
  assert(term.row_text(2) == "┃               counter underflow                ┃");
}

static void overflow_keeps_loop_running() {
  App app;
  HeadlessTerminal term(4, 50);
  ScriptedInput input{Event::press('k'), Event::press('k'), Event::press('k'), Event::press('q')};
  app.run(term, input);
  assert(app.counter() == 2);
  assert(app.status() == "counter overflow");
  assert(input.exhausted());
}

static void draw_failure_names_phase() {
  App app;
  HeadlessTerminal term(4, 50);
  term.fail_refresh(true);
  ScriptedInput input{Event::press('q')};
  bool thrown = false;
  try {
    app.run(term, input);
  } catch (const LoopError& e) {
    thrown = true;
    assert(e.phase() == LoopPhase::Draw);
    assert(std::string(e.what()) == "draw: refresh failed");
  }
  assert(thrown);
  assert(!app.exited());
  assert(!input.exhausted());
}

static void read_failure_names_phase() {
  App app;
  HeadlessTerminal term(4, 50);
  ScriptedInput input;
  input.push_keys("kk");
  bool thrown = false;
  try {
    app.run(term, input);
  } catch (const LoopError& e) {
    thrown = true;
    assert(e.phase() == LoopPhase::ReadEvent);
    assert(std::string(e.what()) == "read event: input script exhausted");
  }
  assert(thrown);
  assert(app.counter() == 2);
  assert(term.frames() == 3);
}

static void exit_is_sticky() {
  App app;
  HeadlessTerminal term(4, 50);
  ScriptedInput input;
  input.push(Event{EventKind::Resize, 0});
  input.push(Event::press('q'));
  app.run(term, input);
  assert(app.exited());
  assert(term.frames() == 2);
  // a second run returns without drawing or reading
  app.run(term, input);
  assert(term.frames() == 2);
  assert(!app.handle_key('k'));
  assert(!app.handle_key('j'));
  assert(app.exited());
  assert(app.counter() == 0);
  assert(app.status().empty());
}

int main() {
  setup_logging(Config{});
  increment_saturates_at_two();
  decrement_stops_at_zero();
  quit_keeps_counter();
  other_keys_are_noops();
  only_presses_dispatch();
  status_clears_on_success();
  end_to_end_session();
  overflow_keeps_loop_running();
  draw_failure_names_phase();
  read_failure_names_phase();
  exit_is_sticky();
  return 0;
}
