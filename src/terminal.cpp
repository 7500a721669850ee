#include "terminal.hpp"
#include "errors.hpp"
#include <locale.h>
#include <stdio.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  // newterm instead of initscr: reports failure instead of exiting
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) throw TerminalInitError("cannot initialize terminal (is TERM set?)");
  set_term(screen_);
  if (raw() == ERR || noecho() == ERR || keypad(stdscr, TRUE) == ERR) {
    endwin();
    delscreen(screen_);
    screen_ = nullptr;
    throw TerminalInitError("cannot configure terminal modes");
  }
  curs_set(0);
}

Terminal::~Terminal() {
  if (!screen_) return;
  endwin();
  delscreen(screen_);
  screen_ = nullptr;
}

void Terminal::restore() {
  if (!screen_) return;
  int rc = endwin();
  delscreen(screen_);
  screen_ = nullptr;
  if (rc == ERR) throw TerminalRestoreError("cannot restore terminal");
}
