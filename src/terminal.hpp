#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown (raw, noecho, keypad,
 * hidden cursor, alternate screen).
 * Usage: construct in main; call restore() on the normal exit path so its
 * failure can be reported. The destructor restores if restore() never ran.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
  void restore();
private:
  SCREEN* screen_ = nullptr;
};
