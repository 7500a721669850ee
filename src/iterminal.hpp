#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, styled draw, refresh).
 * Goal: decouple from concrete impls (ncurses/headless/etc), enable testing.
 */
#include <string>
#include "types.hpp"

struct TermSize { int rows; int cols; };

class IWidget;

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_styled(int row, int col, const std::string& text, const Style& style) = 0;
  virtual void refresh() = 0;

  // One frame: clear, render the widget over the whole screen, flush.
  void draw(const IWidget& widget);
};
