#pragma once
/*
 * Input
 *
 * Purpose: blocking event source for the application loop.
 * NcursesInput reads from the active ncurses screen; ScriptedInput replays a
 * fixed event list for tests and fails once it runs dry.
 */
#include <deque>
#include <initializer_list>

enum class EventKind { KeyPress, KeyRepeat, KeyRelease, Resize, Other };

struct Event {
  EventKind kind = EventKind::Other;
  int key = 0;
  static Event press(int key) { return Event{EventKind::KeyPress, key}; }
};

class IInputSource {
public:
  virtual ~IInputSource() = default;
  virtual Event read_event() = 0;
};

class NcursesInput : public IInputSource {
public:
  Event read_event() override;
};

class ScriptedInput : public IInputSource {
public:
  ScriptedInput() = default;
  ScriptedInput(std::initializer_list<Event> events) : events_(events) {}
  void push(const Event& ev) { events_.push_back(ev); }
  void push_keys(const char* keys);
  Event read_event() override;
  bool exhausted() const { return events_.empty(); }
private:
  std::deque<Event> events_;
};
