#pragma once
/*
 * Widgets
 *
 * Purpose: terminal-independent widget tree (Span/Line/Title/Block/Paragraph)
 * and its rasterization into any ITerminal.
 * Constraint: widgets are plain values; rendering has no side effects
 * besides the draw calls on the target terminal.
 */
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "iterminal.hpp"
#include "types.hpp"

class IWidget {
public:
  virtual ~IWidget() = default;
  virtual void render(const Rect& area, ITerminal& term) const = 0;
};

enum class Alignment { Left, Center, Right };

struct Span {
  std::string content;
  Style style{};
  Span() = default;
  Span(std::string text, Style s = {}) : content(std::move(text)), style(s) {}
  int width() const;
  bool operator==(const Span&) const = default;
};

struct Line {
  std::vector<Span> spans;
  Line() = default;
  Line(std::vector<Span> ss) : spans(std::move(ss)) {}
  int width() const;
  bool operator==(const Line&) const = default;
};

struct Title {
  enum class Position { Top, Bottom };
  Line line;
  Alignment alignment = Alignment::Left;
  Position position = Position::Top;
  bool operator==(const Title&) const = default;
};

enum class BorderType { Plain, Thick };

struct Block {
  std::vector<Title> titles;
  BorderType border = BorderType::Plain;
  Rect inner(const Rect& area) const;
  void render(const Rect& area, ITerminal& term) const;
  bool operator==(const Block&) const = default;
};

struct Paragraph {
  std::vector<Line> lines;
  Alignment alignment = Alignment::Left;
  std::optional<Block> block;
  void render(const Rect& area, ITerminal& term) const;
  bool operator==(const Paragraph&) const = default;
};

// Draws one line into a single-row area, clipped to its width.
void render_line(const Line& line, const Rect& area, Alignment alignment, ITerminal& term);
