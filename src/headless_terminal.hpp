#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Keeps a cell grid (glyph + style) of the current frame; draws outside the
 * grid are clipped. refresh() counts frames and can be told to fail.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  struct Cell {
    std::string glyph = " ";
    Style style{};
    bool operator==(const Cell&) const = default;
  };

  HeadlessTerminal(int rows, int cols);
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_styled(int row, int col, const std::string& text, const Style& style) override;
  void refresh() override;

  const Cell& cell(int row, int col) const;
  std::string row_text(int row) const;
  // All rows joined with '\n', no trailing newline.
  std::string screen_text() const;
  const std::vector<Cell>& cells() const { return cells_; }
  int frames() const { return frames_; }
  void resize(int rows, int cols);
  void fail_refresh(bool fail) { fail_refresh_ = fail; }
private:
  int rows_;
  int cols_;
  std::vector<Cell> cells_;
  int frames_ = 0;
  bool fail_refresh_ = false;
};
