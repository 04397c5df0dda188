#include "headless_terminal.hpp"
#include "renderer.hpp"
#include "widget.hpp"
#include <cassert>
#include <limits>
#include <string>
#include <vector>

static void test_first_cycle() {
  HeadlessTerminal t(5, 1);
  Renderer r(t);
  assert(r.viewport_area() == (Rect{0, 0, 5, 1}));
  std::string msg;
  auto done = r.draw([](Frame& f) { f.render_text("Hello", f.size()); }, msg);
  assert(done);
  assert(done->count == 0);
  assert(done->area == (Rect{0, 0, 5, 1}));
  assert(canvas_to_string(*done->buffer) == "Hello");
  assert(canvas_to_string(t.screen()) == "Hello");
  assert(r.last_patch_stats().full_repaint);
  assert(r.last_patch_stats().runs == 1);
  assert(r.frame_count() == 1);
}

static void test_call_order_and_cursor() {
  HeadlessTerminal t(5, 2);
  Renderer r(t);
  std::string msg;
  assert(r.draw([](Frame& f) { f.render_text("ab", f.size()); }, msg));
  // no set_cursor: hidden, and the patch comes before cursor and flush
  std::vector<std::string> expect = {"move 0 0", "write ab   ", "move 1 0", "write      ", "hide", "flush"};
  assert(t.ops() == expect);
  assert(!t.cursor_visible());

  t.clear_ops();
  assert(r.draw([](Frame& f) {
    f.render_text("ab", f.size());
    f.set_cursor(1, 0);
    f.set_cursor(3, 1);
  }, msg));
  assert(t.cursor_visible());
  assert(t.cursor() == (Position{3, 1}));
  std::vector<std::string> tail = {"move 1 3", "show", "flush"};
  assert(t.ops() == tail); // unchanged content: no patch writes at all
  assert(r.last_patch_stats().runs == 0);
  assert(!r.cursor_hidden());
}

static void test_identical_cycles() {
  HeadlessTerminal t(10, 3);
  Renderer r(t);
  Label label("static", Style{}.add(ModBold));
  std::string msg;
  auto fn = [&label](Frame& f) { f.render_widget_ref(label, f.size()); };
  assert(r.draw(fn, msg));
  t.clear_ops();
  assert(r.draw(fn, msg));
  assert(r.last_patch_stats().cells == 0);
  assert(t.writes() == 0);
  assert(t.refreshes() == 1);
}

static void test_count_wraps() {
  HeadlessTerminal t(2, 1);
  RendererOptions opts;
  opts.initial_count = std::numeric_limits<FrameCount>::max();
  Renderer r(t, opts);
  std::string msg;
  FrameCount seen = 0;
  auto done = r.draw([&seen](Frame& f) { seen = f.count(); }, msg);
  assert(done && done->count == std::numeric_limits<FrameCount>::max());
  assert(seen == std::numeric_limits<FrameCount>::max());
  done = r.draw([&seen](Frame& f) { seen = f.count(); }, msg);
  assert(done && done->count == 0);
  assert(seen == 0);
}

static void test_io_failure() {
  HeadlessTerminal t(4, 1);
  Renderer r(t);
  std::string msg;
  assert(r.draw([](Frame& f) { f.render_text("ab", f.size()); }, msg));

  t.fail_writes_after(0);
  auto done = r.draw([](Frame& f) { f.render_text("cd", f.size()); }, msg);
  assert(!done);
  assert(msg == "io failure: write: broken pipe");
  assert(r.frame_count() == 1);
  // what was on screen before the failure is still the reference
  assert(canvas_to_string(r.previous_buffer()) == "ab  ");

  t.fail_writes_after(-1);
  t.fail_refresh(true);
  msg.clear();
  assert(!r.draw([](Frame& f) { f.render_text("cd", f.size()); }, msg));
  assert(msg == "io failure: flush: device not ready");

  // recovery repaints everything
  t.fail_refresh(false);
  done = r.draw([](Frame& f) { f.render_text("cd", f.size()); }, msg);
  assert(done);
  assert(r.last_patch_stats().full_repaint);
  assert(canvas_to_string(t.screen()) == "cd  ");
  assert(done->count == 1);
}

static void test_reentrant_draw_rejected() {
  HeadlessTerminal t(4, 1);
  Renderer r(t);
  std::string outer, inner;
  bool inner_ok = true;
  auto done = r.draw([&](Frame& f) {
    inner_ok = r.draw([](Frame&) {}, inner).has_value();
    f.render_text("ok", f.size());
  }, outer);
  assert(done);
  assert(!inner_ok);
  assert(inner == "draw called from inside a drawing callback");
  // the busy flag is released after the cycle
  assert(r.draw([](Frame&) {}, outer));
}

static void test_resize() {
  HeadlessTerminal t(4, 1);
  Renderer r(t);
  std::string msg;
  auto fn = [](Frame& f) { f.render_text("abcdef", f.size()); };
  assert(r.draw(fn, msg));
  assert(r.draw(fn, msg));
  assert(!r.last_patch_stats().full_repaint);

  t.set_size(6, 2);
  t.clear_ops();
  auto done = r.draw(fn, msg);
  assert(done);
  assert(done->area == (Rect{0, 0, 6, 2}));
  assert(r.viewport_area() == (Rect{0, 0, 6, 2}));
  assert(r.last_patch_stats().full_repaint);
  assert(r.last_patch_stats().cells == 12);
  assert(t.ops()[0] == "clear");
  assert(canvas_to_string(t.screen()) == "abcdef\n      ");
}

static void test_fixed_viewport() {
  HeadlessTerminal t(10, 4);
  RendererOptions opts;
  opts.viewport.kind = ViewportKind::Fixed;
  opts.viewport.area = Rect{2, 1, 4, 2};
  Renderer r(t, opts);
  std::string msg;
  Rect seen{};
  auto done = r.draw([&seen](Frame& f) {
    seen = f.size();
    f.render_text("wxyz!", f.size());
  }, msg);
  assert(done);
  assert(seen == (Rect{2, 1, 4, 2}));
  assert(canvas_to_string(t.screen()) == "          \n  wxyz    \n          \n          ");

  // a fixed viewport ignores terminal size changes
  t.set_size(20, 10);
  assert(r.draw([](Frame&) {}, msg));
  assert(r.viewport_area() == (Rect{2, 1, 4, 2}));
}

static void test_clear_forces_repaint() {
  HeadlessTerminal t(3, 1);
  Renderer r(t);
  std::string msg;
  auto fn = [](Frame& f) { f.render_text("abc", f.size()); };
  assert(r.draw(fn, msg));
  assert(r.clear(msg));
  assert(canvas_to_string(t.screen()) == "   ");
  assert(r.draw(fn, msg));
  assert(r.last_patch_stats().full_repaint);
  assert(canvas_to_string(t.screen()) == "abc");
}

static void test_destructor_restores_cursor() {
  HeadlessTerminal t(3, 1);
  {
    Renderer r(t);
    std::string msg;
    assert(r.draw([](Frame&) {}, msg));
    assert(!t.cursor_visible());
  }
  assert(t.cursor_visible());
}

static void test_failed_resize_still_repaints() {
  HeadlessTerminal t(4, 1);
  Renderer r(t);
  std::string msg;
  assert(r.draw([](Frame& f) { f.render_text("abcd", f.size()); }, msg));

  // the terminal grew but kept its old rows, and clearing it fails once
  t.set_size(4, 2);
  t.load(Canvas::with_lines({"abcd", "zzzz"}));
  t.fail_next_clear();
  auto fn = [](Frame& f) { f.render_text("x", f.size()); };
  assert(!r.draw(fn, msg));
  assert(msg == "io failure: clear: i/o error");
  assert(r.viewport_area() == (Rect{0, 0, 4, 2}));

  auto done = r.draw(fn, msg);
  assert(done);
  assert(r.last_patch_stats().full_repaint);
  assert(canvas_to_string(t.screen()) == "x   \n    ");
  assert(r.draw(fn, msg));
  assert(!r.last_patch_stats().full_repaint);
}

static void test_cursor_outside_viewport_is_clamped() {
  HeadlessTerminal t(5, 1);
  Renderer r(t);
  std::string msg;
  auto fn = [](Frame& f) {
    f.render_text("Hello", f.size());
    f.set_cursor(f.size().width, 0);
  };
  for (FrameCount i = 0; i < 3; ++i) {
    auto done = r.draw(fn, msg);
    assert(done);
    assert(done->count == i);
  }
  assert(!r.last_patch_stats().full_repaint);
  assert(t.cursor_visible());
  assert(t.cursor() == (Position{4, 0}));

  assert(r.draw([](Frame& f) { f.set_cursor(-3, 9); }, msg));
  assert(t.cursor() == (Position{0, 0}));
}

int main() {
  test_first_cycle();
  test_call_order_and_cursor();
  test_identical_cycles();
  test_count_wraps();
  test_io_failure();
  test_reentrant_draw_rejected();
  test_resize();
  test_fixed_viewport();
  test_clear_forces_repaint();
  test_destructor_restores_cursor();
  test_failed_resize_still_repaints();
  test_cursor_outside_viewport_is_clamped();
  return 0;
}
