#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs (Position/Rect/TermSize).
 * Principle: carry simple geometry; no rendering logic here.
 */
#include <algorithm>
#include <string>

struct Position { int x = 0; int y = 0; };

inline bool operator==(const Position& a, const Position& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Position& a, const Position& b) { return !(a == b); }

struct TermSize { int rows = 0; int cols = 0; };

struct Rect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  int area() const { return empty() ? 0 : width * height; }
  bool empty() const { return width <= 0 || height <= 0; }
  int left() const { return x; }
  int right() const { return x + width; }
  int top() const { return y; }
  int bottom() const { return y + height; }
  bool contains(int px, int py) const { return px >= x && px < right() && py >= y && py < bottom(); }

  Rect intersection(const Rect& o) const {
    int x1 = std::max(x, o.x), y1 = std::max(y, o.y);
    int x2 = std::min(right(), o.right()), y2 = std::min(bottom(), o.bottom());
    if (x2 <= x1 || y2 <= y1) return Rect{x1, y1, 0, 0};
    return Rect{x1, y1, x2 - x1, y2 - y1};
  }

  Rect union_with(const Rect& o) const {
    int x1 = std::min(x, o.x), y1 = std::min(y, o.y);
    int x2 = std::max(right(), o.right()), y2 = std::max(bottom(), o.bottom());
    return Rect{x1, y1, x2 - x1, y2 - y1};
  }

  std::string to_string() const {
    return std::to_string(width) + "x" + std::to_string(height) + "+" + std::to_string(x) + "+" + std::to_string(y);
  }
};

inline bool operator==(const Rect& a, const Rect& b) {
  return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}
inline bool operator!=(const Rect& a, const Rect& b) { return !(a == b); }
