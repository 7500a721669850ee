#include "widgets.hpp"
#include <algorithm>
#include "utf8.hpp"

namespace {

struct BorderSymbols {
  const char* top_left;
  const char* top_right;
  const char* bottom_left;
  const char* bottom_right;
  const char* horizontal;
  const char* vertical;
};

const BorderSymbols& symbols_for(BorderType type) {
  static const BorderSymbols plain{"┌", "┐", "└", "┘", "─", "│"};
  static const BorderSymbols thick{"┏", "┓", "┗", "┛", "━", "┃"};
  return type == BorderType::Thick ? thick : plain;
}

std::string repeat(const char* s, int n) {
  std::string out;
  for (int i = 0; i < n; ++i) out += s;
  return out;
}

} // namespace

int Span::width() const { return utf8_width(content); }

int Line::width() const {
  int w = 0;
  for (const auto& s : spans) w += s.width();
  return w;
}

void render_line(const Line& line, const Rect& area, Alignment alignment, ITerminal& term) {
  if (area.empty()) return;
  int shown = std::min(line.width(), area.width);
  int col = area.col;
  if (alignment == Alignment::Center) col += (area.width - shown) / 2;
  else if (alignment == Alignment::Right) col += area.width - shown;
  int left = shown;
  for (const auto& span : line.spans) {
    if (left <= 0) break;
    std::string part = utf8_prefix(span.content, left);
    int w = utf8_width(part);
    if (w == 0) continue;
    if (span.style == Style{}) term.draw_text(area.row, col, part);
    else term.draw_styled(area.row, col, part, span.style);
    col += w;
    left -= w;
  }
}

Rect Block::inner(const Rect& area) const {
  return Rect{area.row + 1, area.col + 1, std::max(0, area.height - 2), std::max(0, area.width - 2)};
}

void Block::render(const Rect& area, ITerminal& term) const {
  if (area.empty()) return;
  const BorderSymbols& sym = symbols_for(border);
  int last_row = area.row + area.height - 1;
  int last_col = area.col + area.width - 1;
  std::string horiz = repeat(sym.horizontal, std::max(0, area.width - 2));

  std::string top = sym.top_left;
  if (area.width > 1) top += horiz + sym.top_right;
  term.draw_text(area.row, area.col, top);
  if (area.height > 1) {
    std::string bottom = sym.bottom_left;
    if (area.width > 1) bottom += horiz + sym.bottom_right;
    term.draw_text(last_row, area.col, bottom);
  }
  for (int r = area.row + 1; r < last_row; ++r) {
    term.draw_text(r, area.col, sym.vertical);
    if (area.width > 1) term.draw_text(r, last_col, sym.vertical);
  }

  // titles sit on the border rows, between the corners
  Rect inside = inner(area);
  for (const auto& t : titles) {
    int row = t.position == Title::Position::Top ? area.row : last_row;
    if (t.position == Title::Position::Bottom && area.height < 2) continue;
    render_line(t.line, Rect{row, inside.col, 1, inside.width}, t.alignment, term);
  }
}

void Paragraph::render(const Rect& area, ITerminal& term) const {
  if (area.empty()) return;
  Rect body = area;
  if (block) {
    block->render(area, term);
    body = block->inner(area);
  }
  int rows = std::min(static_cast<int>(lines.size()), body.height);
  for (int i = 0; i < rows; ++i) {
    render_line(lines[i], Rect{body.row + i, body.col, 1, body.width}, alignment, term);
  }
}
