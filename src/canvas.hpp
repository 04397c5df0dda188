#pragma once
/*
 * Canvas
 *
 * Purpose: 2-D cell grid covering a Rect, stored row-major; the unit the
 *          renderer diffs between cycles.
 * Contract: writes outside the area are dropped (drawing code clips by relying
 *           on this); reads outside the area are reported, not clamped.
 * Coordinates: absolute, so a Canvas whose area starts at (10,2) answers
 *              cell_at(10,2) for its first cell.
 */
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include "cell.hpp"
#include "types.hpp"

class Canvas {
public:
  Canvas() = default;
  explicit Canvas(const Rect& area);

  static Canvas empty(const Rect& area) { return Canvas(area); }
  static Canvas filled(const Rect& area, const Cell& cell);
  // rows are UTF-8 text; width is the widest row in columns
  static Canvas with_lines(const std::vector<std::string>& lines);

  const Rect& area() const { return area_; }
  std::span<const Cell> content() const { return cells_; }
  size_t size() const { return cells_.size(); }

  // empty optional means InvalidCoordinate
  std::optional<Cell> cell_at(int x, int y) const;
  std::optional<Cell> cell_at(int x, int y, std::string& msg) const;
  Cell* cell_mut(int x, int y);
  const Cell* cell_ptr(int x, int y) const;

  void set_cell(int x, int y, const Cell& cell);
  int set_text(int x, int y, std::string_view text, const Style& style);
  int set_text_n(int x, int y, std::string_view text, int max_width, const Style& style);
  void set_style(const Rect& area, const Style& style);

  void resize(const Rect& area);
  void reset();
  void merge(const Canvas& other);

  size_t index_of(int x, int y) const;
  Position pos_of(size_t index) const;

private:
  Rect area_{};
  std::vector<Cell> cells_;
};

bool operator==(const Canvas& a, const Canvas& b);
inline bool operator!=(const Canvas& a, const Canvas& b) { return !(a == b); }

struct CanvasHash {
  std::size_t operator()(const Canvas& c) const;
};

// one line per row with continuation cells dropped; used in test failure output
std::string canvas_to_string(const Canvas& c);
