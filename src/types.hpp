#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Rect/Style/Color).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
  bool empty() const { return height <= 0 || width <= 0; }
  bool operator==(const Rect&) const = default;
};

enum class Color { Default, Blue, Yellow, Red };

struct Style {
  Color fg = Color::Default;
  bool bold = false;
  bool operator==(const Style&) const = default;
};
