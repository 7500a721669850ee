#include "ncurses_terminal.hpp"
#include "errors.hpp"

// color pair ids, one per non-default Color
static constexpr short PAIR_BLUE = 1;
static constexpr short PAIR_YELLOW = 2;
static constexpr short PAIR_RED = 3;

NcursesTerminal::NcursesTerminal(bool enable_color) {
  if (enable_color && has_colors()) {
    start_color();
    short bg = use_default_colors() == OK ? -1 : COLOR_BLACK;
    init_pair(PAIR_BLUE, COLOR_BLUE, bg);
    init_pair(PAIR_YELLOW, COLOR_YELLOW, bg);
    init_pair(PAIR_RED, COLOR_RED, bg);
    color_ = true;
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

attr_t attrs_for(const Style& style, bool color) {
  attr_t a = A_NORMAL;
  if (style.bold) a |= A_BOLD;
  if (!color) return a;
  switch (style.fg) {
    case Color::Blue: a |= COLOR_PAIR(PAIR_BLUE); break;
    case Color::Yellow: a |= COLOR_PAIR(PAIR_YELLOW); break;
    case Color::Red: a |= COLOR_PAIR(PAIR_RED); break;
    case Color::Default: break;
  }
  return a;
}

void NcursesTerminal::draw_styled(int row, int col, const std::string& text, const Style& style) {
  attr_t a = attrs_for(style, color_);
  attr_on(a, nullptr);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attr_off(a, nullptr);
}

void NcursesTerminal::refresh() {
  if (::refresh() == ERR) throw TerminalIoError("refresh failed");
}
