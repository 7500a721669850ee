#include "headless_terminal.hpp"
#include "errors.hpp"
#include "utf8.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols), cells_(static_cast<size_t>(rows * cols)) {}

TermSize HeadlessTerminal::getSize() const { return {rows_, cols_}; }

void HeadlessTerminal::clear() {
  for (auto& c : cells_) c = Cell{};
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  draw_styled(row, col, text, Style{});
}

void HeadlessTerminal::draw_styled(int row, int col, const std::string& text, const Style& style) {
  if (row < 0 || row >= rows_) return;
  for (const auto& g : utf8_glyphs(text)) {
    if (col >= cols_) break;
    if (col >= 0) cells_[static_cast<size_t>(row * cols_ + col)] = Cell{g, style};
    col++;
  }
}

void HeadlessTerminal::refresh() {
  if (fail_refresh_) throw TerminalIoError("refresh failed");
  frames_++;
}

const HeadlessTerminal::Cell& HeadlessTerminal::cell(int row, int col) const {
  return cells_.at(static_cast<size_t>(row * cols_ + col));
}

std::string HeadlessTerminal::row_text(int row) const {
  std::string s;
  for (int c = 0; c < cols_; ++c) s += cell(row, c).glyph;
  return s;
}

std::string HeadlessTerminal::screen_text() const {
  std::string s;
  for (int r = 0; r < rows_; ++r) {
    if (r > 0) s += '\n';
    s += row_text(r);
  }
  return s;
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  cells_.assign(static_cast<size_t>(rows * cols), Cell{});
}
