#include "diff.hpp"
#include <algorithm>

std::vector<CellUpdate> full_repaint(const Canvas& next) {
  std::vector<CellUpdate> out;
  auto cells = next.content();
  out.reserve(cells.size());
  const int w = next.area().width;
  int to_skip = 0; // same rule as diff_canvases: nothing under a wide glyph
  for (size_t i = 0; i < cells.size(); ++i) {
    if (w > 0 && i % static_cast<size_t>(w) == 0) to_skip = 0;
    const Cell& cur = cells[i];
    if (to_skip == 0 && !cur.is_continuation()) {
      Position p = next.pos_of(i);
      out.push_back(CellUpdate{p.x, p.y, &cur});
    }
    to_skip = to_skip > 0 ? to_skip - 1 : std::max(0, cur.width() - 1);
  }
  return out;
}

std::vector<CellUpdate> diff_canvases(const Canvas& prev, const Canvas& next) {
  if (prev.area() != next.area()) return full_repaint(next);
  std::vector<CellUpdate> out;
  auto p = prev.content();
  auto n = next.content();
  const int w = next.area().width;
  int invalidated = 0; // cells still covered by a wide glyph of prev
  int to_skip = 0;     // cells covered by a wide glyph of next
  for (size_t i = 0; i < n.size(); ++i) {
    if (w > 0 && i % static_cast<size_t>(w) == 0) invalidated = to_skip = 0;
    const Cell& cur = n[i];
    const Cell& old = p[i];
    if (to_skip == 0 && !cur.is_continuation() && (cur != old || invalidated > 0)) {
      Position pos = next.pos_of(i);
      out.push_back(CellUpdate{pos.x, pos.y, &cur});
    }
    int cw = cur.width();
    to_skip = to_skip > 0 ? to_skip - 1 : std::max(0, cw - 1);
    int affected = std::max(cw, old.width());
    invalidated = std::max(0, std::max(affected, invalidated) - 1);
  }
  return out;
}

Patch build_patch(const std::vector<CellUpdate>& updates) {
  Patch patch;
  patch.cells = updates.size();
  int end_x = -1, end_y = -1; // where the previous run left the cursor
  for (const auto& u : updates) {
    const Cell& c = *u.cell;
    int cw = c.width();
    bool adjacent = (u.y == end_y && u.x == end_x);
    if (adjacent && !patch.runs.empty() && patch.runs.back().style == c.style) {
      Run& r = patch.runs.back();
      r.text += c.symbol;
      r.width += cw;
    } else {
      Run r;
      r.x = u.x;
      r.y = u.y;
      r.width = cw;
      r.style = c.style;
      r.text = c.symbol;
      r.reposition = !adjacent;
      patch.runs.push_back(std::move(r));
    }
    // a zero-width symbol leaves the cursor where it was; move before the next cell
    end_x = cw > 0 ? u.x + cw : -1;
    end_y = u.y;
  }
  return patch;
}

Patch compute_patch(const Canvas& prev, const Canvas& next) {
  Patch patch = build_patch(diff_canvases(prev, next));
  patch.full_repaint = prev.area() != next.area();
  return patch;
}

bool apply_patch(ITerminal& term, const Patch& patch, std::string& msg) {
  for (const auto& r : patch.runs) {
    if (r.reposition && !term.move_cursor(r.y, r.x)) {
      msg = term.last_error();
      return false;
    }
    if (!term.write_text(r.text, r.style)) {
      msg = term.last_error();
      return false;
    }
  }
  return true;
}
