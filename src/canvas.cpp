#include "canvas.hpp"
#include "unicode_width.hpp"
#include <algorithm>

Canvas::Canvas(const Rect& area) : area_(area) {
  cells_.resize(static_cast<size_t>(std::max(0, area.area())));
}

Canvas Canvas::filled(const Rect& area, const Cell& cell) {
  Canvas c(area);
  std::fill(c.cells_.begin(), c.cells_.end(), cell);
  return c;
}

Canvas Canvas::with_lines(const std::vector<std::string>& lines) {
  int width = 0;
  for (const auto& l : lines) width = std::max(width, display_width(l));
  Canvas c(Rect{0, 0, width, static_cast<int>(lines.size())});
  for (size_t i = 0; i < lines.size(); ++i) c.set_text(0, static_cast<int>(i), lines[i], Style{});
  return c;
}

size_t Canvas::index_of(int x, int y) const {
  return static_cast<size_t>(y - area_.y) * static_cast<size_t>(area_.width) + static_cast<size_t>(x - area_.x);
}

Position Canvas::pos_of(size_t index) const {
  if (area_.width <= 0) return Position{area_.x, area_.y};
  int w = area_.width;
  return Position{area_.x + static_cast<int>(index % static_cast<size_t>(w)),
                  area_.y + static_cast<int>(index / static_cast<size_t>(w))};
}

std::optional<Cell> Canvas::cell_at(int x, int y) const {
  if (!area_.contains(x, y)) return std::nullopt;
  return cells_[index_of(x, y)];
}

std::optional<Cell> Canvas::cell_at(int x, int y, std::string& msg) const {
  auto c = cell_at(x, y);
  if (!c) {
    msg = "invalid coordinate (" + std::to_string(x) + ", " + std::to_string(y) + ") outside " + area_.to_string();
  }
  return c;
}

Cell* Canvas::cell_mut(int x, int y) {
  if (!area_.contains(x, y)) return nullptr;
  return &cells_[index_of(x, y)];
}

const Cell* Canvas::cell_ptr(int x, int y) const {
  if (!area_.contains(x, y)) return nullptr;
  return &cells_[index_of(x, y)];
}

void Canvas::set_cell(int x, int y, const Cell& cell) {
  if (Cell* c = cell_mut(x, y)) *c = cell;
}

int Canvas::set_text(int x, int y, std::string_view text, const Style& style) {
  return set_text_n(x, y, text, area_.right() - x, style);
}

int Canvas::set_text_n(int x, int y, std::string_view text, int max_width, const Style& style) {
  if (y < area_.top() || y >= area_.bottom()) return x;
  int limit = std::min(area_.right(), x + std::max(0, max_width));
  for (const auto& g : split_graphemes(text)) {
    if (x + g.width > limit) break;
    if (x >= area_.left()) {
      // writing over the right half of a wide glyph breaks it
      Cell* here = cell_mut(x, y);
      if (here->is_continuation() && x > area_.left()) {
        Cell* prev = cell_mut(x - 1, y);
        if (prev->width() > 1) prev->reset();
      }
      // and so does replacing its left half
      if (here->width() > 1) {
        Cell* next = cell_mut(x + 1, y);
        if (next && next->is_continuation()) next->reset();
      }
      here->symbol = g.symbol;
      here->style = style;
      for (int k = 1; k < g.width; ++k) {
        Cell* hidden = cell_mut(x + k, y);
        if (!hidden) continue;
        if (hidden->width() > 1) {
          Cell* after = cell_mut(x + k + 1, y);
          if (after && after->is_continuation()) after->reset();
        }
        *hidden = Cell::continuation(style);
      }
    }
    x += g.width;
  }
  return x;
}

void Canvas::set_style(const Rect& area, const Style& style) {
  Rect r = area_.intersection(area);
  for (int y = r.top(); y < r.bottom(); ++y)
    for (int x = r.left(); x < r.right(); ++x)
      cells_[index_of(x, y)].set_style(style);
}

void Canvas::resize(const Rect& area) {
  area_ = area;
  cells_.assign(static_cast<size_t>(std::max(0, area.area())), Cell{});
}

void Canvas::reset() {
  for (auto& c : cells_) c.reset();
}

void Canvas::merge(const Canvas& other) {
  Rect area = area_.union_with(other.area_);
  Canvas grown(area);
  for (size_t i = 0; i < cells_.size(); ++i) {
    Position p = pos_of(i);
    grown.cells_[grown.index_of(p.x, p.y)] = cells_[i];
  }
  for (size_t i = 0; i < other.cells_.size(); ++i) {
    Position p = other.pos_of(i);
    grown.cells_[grown.index_of(p.x, p.y)] = other.cells_[i];
  }
  *this = std::move(grown);
}

bool operator==(const Canvas& a, const Canvas& b) {
  if (a.area() != b.area()) return false;
  auto ca = a.content(), cb = b.content();
  return std::equal(ca.begin(), ca.end(), cb.begin(), cb.end());
}

std::size_t CanvasHash::operator()(const Canvas& c) const {
  const Rect& r = c.area();
  std::size_t h = static_cast<std::size_t>(r.x) * 131 + static_cast<std::size_t>(r.y);
  h = h * 131 + static_cast<std::size_t>(r.width);
  h = h * 131 + static_cast<std::size_t>(r.height);
  for (const auto& cell : c.content()) h = h * 1099511628211ULL ^ hash_cell(cell);
  return h;
}

std::string canvas_to_string(const Canvas& c) {
  std::string out;
  const Rect& r = c.area();
  for (int y = r.top(); y < r.bottom(); ++y) {
    for (int x = r.left(); x < r.right(); ++x) out += c.cell_ptr(x, y)->symbol;
    if (y + 1 < r.bottom()) out += '\n';
  }
  return out;
}
