#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing.
 * Note: initialization/teardown is managed by Terminal RAII wrapper;
 * construct this only while a Terminal session is active.
 */
#include "iterminal.hpp"
#include <ncurses.h>

// ncurses attributes for a style: A_BOLD for bold, the Color's pair when
// `color` is set. Needs no active screen.
attr_t attrs_for(const Style& style, bool color);

class NcursesTerminal : public ITerminal {
public:
  explicit NcursesTerminal(bool enable_color = true);
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_styled(int row, int col, const std::string& text, const Style& style) override;
  void refresh() override;
private:
  bool color_ = false;
};
