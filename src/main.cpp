#include "config.hpp"
#include "logging.hpp"
#include "renderer.hpp"
#include "unicode_width.hpp"
#include "widget.hpp"
#if TF_BACKEND == TF_BACKEND_HEADLESS
#include "headless_terminal.hpp"
#else
#include "ncurses_terminal.hpp"
#include "terminal.hpp"
#endif
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

// bounces across the middle row of its area, one column per frame
class Marker : public Widget {
public:
  explicit Marker(FrameCount n) : n_(n) {}
  void render(const Rect& area, Canvas& buf) && override {
    if (area.empty()) return;
    int span = std::max(1, area.width - 1);
    int step = static_cast<int>(n_ % static_cast<FrameCount>(2 * span));
    int x = step < span ? step : 2 * span - step;
    buf.set_text(area.x + x, area.y + area.height / 2, "*", Style{}.set_fg(Color::Cyan).add(ModBold));
  }
private:
  FrameCount n_;
};

// tick(ms) waits for the next frame; false stops the loop
static bool run_demo(ITerminal& term, const Config& cfg, const std::function<bool(int)>& tick, std::string& msg) {
  Renderer renderer(term, cfg.renderer);

  auto title = std::make_shared<Label>("ttyframe (" TF_BACKEND_NAME ")", Style{}.add(ModBold));
  auto help = std::make_shared<Label>("q: quit", Style{}.add(ModDim));
  SplitView header(title);
  if (header.split_vertical(0, help, 0.7f) < 0) {
    msg = "demo layout has no slot 0";
    return false;
  }

  auto draw_fn = [&header](Frame& frame) {
    Rect area = frame.size();
    Rect head{area.x, area.y, area.width, std::min(1, area.height)};
    Rect body{area.x, area.y + head.height, area.width, area.height - head.height};
    frame.render_widget_ref(header, head);
    if (body.empty()) return;
    frame.render_widget(Clear{}, body);
    std::string counter = "frame " + std::to_string(frame.count());
    frame.render_text(counter, Rect{body.x, body.y, body.width, 1}, Style{}.set_fg(Color::Yellow));
    frame.render_widget(Marker(frame.count()), Rect{body.x, body.y + 1, body.width, body.height - 1});
    frame.set_cursor(body.x + std::min(display_width(counter), body.width - 1), body.y);
  };

  const int frame_ms = 1000 / cfg.fps;
  for (int i = 0; cfg.frames == 0 || i < cfg.frames; ++i) {
    if (!renderer.draw(draw_fn, msg)) return false;
    if (!tick(frame_ms)) break;
  }
  spdlog::info("demo: stopped after {} frames", renderer.frame_count() - cfg.renderer.initial_count);
  return true;
}

int main(int argc, char** argv) {
  Config cfg;
  std::string msg;
  bool ok = argc >= 2 ? load_config(std::filesystem::path(argv[1]), cfg, msg) : load_default_config(cfg, msg);
  if (!ok || !init_logging(cfg.log, msg)) {
    std::cerr << "ttyframe_demo: " << msg << "\n";
    return 1;
  }
  spdlog::info("demo: backend {}, {} fps, {} frames", TF_BACKEND_NAME, cfg.fps, cfg.frames);

  {
#if TF_BACKEND == TF_BACKEND_HEADLESS
    // no keyboard here, so an unbounded run is capped at one frame
    if (cfg.frames == 0) cfg.frames = 1;
    HeadlessTerminal term(80, 24);
    ok = run_demo(term, cfg, [](int) { return true; }, msg);
    if (ok) std::cout << canvas_to_string(term.screen()) << "\n";
#else
    Terminal session;
    if (!session.ok()) {
      msg = "could not start ncurses";
      ok = false;
    } else {
      NcursesTerminal term(cfg.color);
      ok = run_demo(term, cfg, [&session](int ms) { return session.poll_key(ms) != 'q'; }, msg);
    }
#endif
  }
  if (!ok) {
    std::cerr << "ttyframe_demo: " << msg << "\n";
    return 1;
  }
  return 0;
}
