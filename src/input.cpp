#include "input.hpp"
#include "errors.hpp"
#include <ncurses.h>

Event NcursesInput::read_event() {
  int ch = getch();
  if (ch == ERR) throw InputReadError("getch failed");
  if (ch == KEY_RESIZE) return Event{EventKind::Resize, ch};
  // ncurses has no release/repeat reporting: every key is a press
  return Event::press(ch);
}

void ScriptedInput::push_keys(const char* keys) {
  for (const char* p = keys; *p; ++p) events_.push_back(Event::press(static_cast<unsigned char>(*p)));
}

Event ScriptedInput::read_event() {
  if (events_.empty()) throw InputReadError("input script exhausted");
  Event ev = events_.front();
  events_.pop_front();
  return ev;
}
