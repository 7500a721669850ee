#include "iterminal.hpp"
#include "widgets.hpp"

void ITerminal::draw(const IWidget& widget) {
  clear();
  TermSize sz = getSize();
  widget.render(Rect{0, 0, sz.rows, sz.cols}, *this);
  refresh();
}
