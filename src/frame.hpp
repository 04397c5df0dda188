#pragma once
/*
 * Frame / CompletedFrame
 *
 * Frame: handle given to the drawing callback for exactly one cycle. It holds
 *   the only mutable reference to the current Canvas while the callback runs,
 *   so it can be neither copied nor moved out of the callback.
 * CompletedFrame: read-only result of a finished cycle; it points into the
 *   renderer and goes stale when the next cycle starts.
 */
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include "canvas.hpp"
#include "types.hpp"
#include "widget.hpp"

using FrameCount = std::size_t;

class Frame {
public:
  Frame(Canvas& buffer, const Rect& viewport, FrameCount count)
    : buffer_(buffer), viewport_(viewport), count_(count) {}
  Frame(const Frame&) = delete;
  Frame& operator=(const Frame&) = delete;
  Frame(Frame&&) = delete;
  Frame& operator=(Frame&&) = delete;

  // Fixed for the whole cycle; lay out against this, not against resize events
  // seen while drawing.
  const Rect& size() const { return viewport_; }

  // Show the cursor at (x, y) once the cycle is flushed. Last call wins; no call
  // leaves the cursor hidden.
  void set_cursor(int x, int y) { cursor_ = Position{x, y}; }
  const std::optional<Position>& cursor() const { return cursor_; }

  Canvas& buffer_mut() { return buffer_; }

  // Number of cycles completed before this one (wraps to 0 past the max).
  FrameCount count() const { return count_; }

  void render_widget(Widget&& widget, const Rect& area) { std::move(widget).render(area, buffer_); }
  void render_widget_ref(const WidgetRef& widget, const Rect& area) { widget.render_ref(area, buffer_); }
  void render_text(std::string_view text, const Rect& area, const Style& style = {}) { render_str(text, area, buffer_, style); }

private:
  Canvas& buffer_;
  Rect viewport_;
  std::optional<Position> cursor_;
  FrameCount count_ = 0;
};

struct CompletedFrame {
  const Canvas* buffer = nullptr;
  Rect area{};
  FrameCount count = 0;
};
