#pragma once
/*
 * Renderer
 *
 * Purpose: double-buffered render driver. Owns the current/previous canvases
 *          and runs one cycle per draw():
 *            Idle -> Drawing  (Frame over the current canvas, callback runs)
 *                 -> Diffing  (Frame gone, patch = diff(previous, current))
 *                 -> Flushing (patch, cursor intent, refresh on the ITerminal)
 *                 -> Idle     (buffers swapped, CompletedFrame returned)
 * Dependency: writes only through ITerminal so backends can be swapped.
 * Resize: a fullscreen viewport follows the terminal size before each cycle;
 *         a size change reallocates both canvases and forces a full repaint.
 */
#include <functional>
#include <optional>
#include <string>
#include "canvas.hpp"
#include "diff.hpp"
#include "frame.hpp"
#include "iterminal.hpp"
#include "types.hpp"

enum class ViewportKind { Fullscreen, Fixed };

struct Viewport {
  ViewportKind kind = ViewportKind::Fullscreen;
  Rect area{}; // used when kind == Fixed
};

struct RendererOptions {
  Viewport viewport{};
  FrameCount initial_count = 0;
};

struct PatchStats {
  size_t cells = 0;
  size_t runs = 0;
  size_t moves = 0;
  bool full_repaint = false;
};

class Renderer {
public:
  using DrawFn = std::function<void(Frame&)>;

  explicit Renderer(ITerminal& term, const RendererOptions& opts = {});
  ~Renderer();
  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;

  // One full cycle. On io failure returns nullopt with msg "io failure: ...";
  // the next cycle then repaints everything.
  std::optional<CompletedFrame> draw(const DrawFn& fn, std::string& msg);

  bool autoresize(std::string& msg);
  bool resize(const Rect& area, std::string& msg);
  // wipe the terminal and repaint everything on the next flush
  bool clear(std::string& msg);
  // diff + write patch only (no cursor handling, no refresh, no swap)
  bool flush(std::string& msg);
  void swap_buffers();

  bool hide_cursor(std::string& msg);
  bool show_cursor(std::string& msg);
  bool set_cursor(int x, int y, std::string& msg);
  bool cursor_hidden() const { return hidden_cursor_; }

  const Canvas& current_buffer() const { return buffers_[current_]; }
  Canvas& current_buffer_mut() { return buffers_[current_]; }
  const Canvas& previous_buffer() const { return buffers_[1 - current_]; }
  const Rect& viewport_area() const { return viewport_area_; }
  const PatchStats& last_patch_stats() const { return stats_; }
  FrameCount frame_count() const { return count_; }

private:
  bool io_fail(std::string& msg);

  ITerminal& term_;
  Viewport viewport_;
  Rect viewport_area_{};
  Canvas buffers_[2];
  int current_ = 0;
  bool hidden_cursor_ = false;
  bool full_repaint_ = true; // screen content unknown until the first flush
  bool drawing_ = false;
  FrameCount count_ = 0;
  PatchStats stats_;
};
