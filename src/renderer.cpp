#include "renderer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

// clears the busy flag however the cycle ends
struct CycleGuard {
  bool& flag;
  explicit CycleGuard(bool& f) : flag(f) { flag = true; }
  ~CycleGuard() { flag = false; }
};

Rect full_area(const TermSize& sz) { return Rect{0, 0, sz.cols, sz.rows}; }

} // namespace

Renderer::Renderer(ITerminal& term, const RendererOptions& opts)
  : term_(term), viewport_(opts.viewport), count_(opts.initial_count) {
  viewport_area_ = viewport_.kind == ViewportKind::Fixed ? viewport_.area : full_area(term_.get_size());
  buffers_[0].resize(viewport_area_);
  buffers_[1].resize(viewport_area_);
  spdlog::debug("renderer: viewport {} ({})", viewport_area_.to_string(),
                viewport_.kind == ViewportKind::Fixed ? "fixed" : "fullscreen");
}

Renderer::~Renderer() {
  if (hidden_cursor_ && !term_.show_cursor()) {
    spdlog::error("renderer: could not restore cursor: {}", term_.last_error());
  }
}

bool Renderer::io_fail(std::string& msg) {
  msg = "io failure: " + term_.last_error();
  spdlog::error("renderer: {}", msg);
  return false;
}

std::optional<CompletedFrame> Renderer::draw(const DrawFn& fn, std::string& msg) {
  if (drawing_) {
    msg = "draw called from inside a drawing callback";
    spdlog::warn("renderer: {}", msg);
    return std::nullopt;
  }
  CycleGuard guard(drawing_);
  if (!autoresize(msg)) return std::nullopt;

  std::optional<Position> cursor;
  {
    Frame frame(buffers_[current_], viewport_area_, count_);
    fn(frame);
    cursor = frame.cursor();
  }

  bool ok = flush(msg);
  if (ok) {
    if (cursor && !viewport_area_.empty()) ok = set_cursor(cursor->x, cursor->y, msg) && show_cursor(msg);
    else ok = hide_cursor(msg);
  }
  if (ok && !term_.refresh()) ok = io_fail(msg);
  if (!ok) {
    // the screen may hold part of the patch now; start the next cycle from scratch
    buffers_[current_].reset();
    full_repaint_ = true;
    return std::nullopt;
  }

  swap_buffers();
  CompletedFrame done{&buffers_[1 - current_], viewport_area_, count_};
  ++count_; // unsigned, wraps to 0
  return done;
}

bool Renderer::autoresize(std::string& msg) {
  if (viewport_.kind != ViewportKind::Fullscreen) return true;
  Rect area = full_area(term_.get_size());
  if (area == viewport_area_) return true;
  return resize(area, msg);
}

bool Renderer::resize(const Rect& area, std::string& msg) {
  spdlog::info("renderer: resize {} -> {}", viewport_area_.to_string(), area.to_string());
  viewport_area_ = area;
  buffers_[current_].resize(area);
  buffers_[1 - current_].resize(area);
  // repaint on the next flush even if clearing the backend fails below
  full_repaint_ = true;
  return clear(msg);
}

bool Renderer::clear(std::string& msg) {
  buffers_[1 - current_].reset();
  full_repaint_ = true;
  if (!term_.clear()) return io_fail(msg);
  return true;
}

bool Renderer::flush(std::string& msg) {
  const Canvas& prev = buffers_[1 - current_];
  const Canvas& cur = buffers_[current_];
  Patch patch = full_repaint_ ? build_patch(full_repaint(cur)) : compute_patch(prev, cur);
  patch.full_repaint = patch.full_repaint || full_repaint_;

  stats_ = PatchStats{};
  stats_.cells = patch.cells;
  stats_.runs = patch.runs.size();
  for (const auto& r : patch.runs) if (r.reposition) ++stats_.moves;
  stats_.full_repaint = patch.full_repaint;
  if (patch.full_repaint) spdlog::debug("renderer: full repaint of {}", cur.area().to_string());
  spdlog::trace("renderer: frame {} patch cells={} runs={} moves={}", count_, stats_.cells, stats_.runs, stats_.moves);

  std::string err;
  if (!apply_patch(term_, patch, err)) {
    msg = "io failure: " + err;
    spdlog::error("renderer: {}", msg);
    return false;
  }
  full_repaint_ = false;
  return true;
}

void Renderer::swap_buffers() {
  buffers_[1 - current_].reset();
  current_ = 1 - current_;
}

bool Renderer::hide_cursor(std::string& msg) {
  if (!term_.hide_cursor()) return io_fail(msg);
  hidden_cursor_ = true;
  return true;
}

bool Renderer::show_cursor(std::string& msg) {
  if (!term_.show_cursor()) return io_fail(msg);
  hidden_cursor_ = false;
  return true;
}

// positions outside the viewport are pulled onto its nearest edge cell
bool Renderer::set_cursor(int x, int y, std::string& msg) {
  if (viewport_area_.empty()) return true;
  x = std::clamp(x, viewport_area_.left(), viewport_area_.right() - 1);
  y = std::clamp(y, viewport_area_.top(), viewport_area_.bottom() - 1);
  if (!term_.move_cursor(y, x)) return io_fail(msg);
  return true;
}
