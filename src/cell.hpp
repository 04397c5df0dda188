#pragma once
/*
 * Cell
 *
 * Purpose: smallest addressable terminal unit (symbol + style).
 * Note: an empty symbol marks the continuation half of a 2-column glyph.
 */
#include <string>
#include <string_view>
#include "style.hpp"

struct Cell {
  std::string symbol = " ";
  Style style{};

  Cell() = default;
  Cell(std::string_view sym, Style st = {}) : symbol(sym), style(st) {}

  static Cell continuation(Style st = {}) { Cell c; c.symbol.clear(); c.style = st; return c; }

  bool is_continuation() const { return symbol.empty(); }
  int width() const;
  void reset() { symbol = " "; style = Style{}; }
  Cell& set_symbol(std::string_view sym) { symbol.assign(sym); return *this; }
  Cell& set_style(const Style& st) { style = style.patch(st); return *this; }
};

inline bool operator==(const Cell& a, const Cell& b) { return a.symbol == b.symbol && a.style == b.style; }
inline bool operator!=(const Cell& a, const Cell& b) { return !(a == b); }

std::size_t hash_cell(const Cell& c);
