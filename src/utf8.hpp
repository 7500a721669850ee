#pragma once
/*
 * UTF-8 helpers
 *
 * Purpose: cell widths for widget layout and glyph splitting for headless
 * drawing. One code point is one cell; no wide-glyph handling.
 */
#include <string>
#include <vector>

int utf8_width(const std::string& s);
// Longest prefix of s that fits in `cells` cells.
std::string utf8_prefix(const std::string& s, int cells);
std::vector<std::string> utf8_glyphs(const std::string& s);
