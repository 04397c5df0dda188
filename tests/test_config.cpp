#include "config.hpp"
#include "logging.hpp"
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <vector>
#include <unistd.h>

static void test_defaults_and_keys() {
  Config cfg;
  assert(cfg.renderer.viewport.kind == ViewportKind::Fullscreen);
  assert(cfg.fps == 20);
  assert(cfg.frames == 200);

  std::vector<std::string> lines = {
    "# comment",
    "\" vim style comment",
    "",
    "set viewport fixed:2,1,40,12",
    "  :set color off",
    "log_level=debug",
    "set fps 60",
    "frames=0",
    "frame_count 18446744073709551615",
  };
  std::string msg;
  assert(parse_config_lines(lines, "test", cfg, msg));
  assert(cfg.renderer.viewport.kind == ViewportKind::Fixed);
  assert(cfg.renderer.viewport.area == (Rect{2, 1, 40, 12}));
  assert(!cfg.color);
  assert(cfg.log.level == "debug");
  assert(cfg.fps == 60);
  assert(cfg.frames == 0);
  assert(cfg.renderer.initial_count == std::numeric_limits<FrameCount>::max());
}

static void test_errors_name_the_line() {
  Config cfg;
  std::string msg;
  assert(!parse_config_lines({"set fps 30", "set fps 0"}, "rc", cfg, msg));
  assert(msg == "rc:2: fps: value must be 1..240");
  // nothing is applied from a file that fails
  assert(cfg.fps == 20);

  assert(!parse_config_lines({"", "set colour on"}, "rc", cfg, msg));
  assert(msg == "rc:2: unknown option 'colour'");
  assert(!parse_config_lines({"viewport fixed:0,0,0,5"}, "rc", cfg, msg));
  assert(msg.rfind("rc:1: viewport:", 0) == 0);
  assert(!parse_config_lines({"log_level loud"}, "rc", cfg, msg));
  assert(!parse_config_lines({"color maybe"}, "rc", cfg, msg));
  assert(!parse_config_lines({"frame_count -1"}, "rc", cfg, msg));
}

static void test_load_from_file() {
  auto path = std::filesystem::temp_directory_path() / ("ttyframe_rc_" + std::to_string(::getpid()));
  {
    std::ofstream out(path);
    out << "set viewport fullscreen\r\n";
    out << "set log_file /tmp/x.log\r\n";
    out << "set frames 5";
  }
  Config cfg;
  std::string msg;
  assert(load_config(path, cfg, msg));
  assert(cfg.log.file == "/tmp/x.log");
  assert(cfg.frames == 5);
  std::filesystem::remove(path);

  assert(!load_config(path, cfg, msg));
  assert(msg.rfind("can not open file: ", 0) == 0);
  assert(!load_config(std::filesystem::temp_directory_path(), cfg, msg));
}

static void test_logging_init() {
  std::string msg;
  LogConfig lc;
  lc.level = "warn";
  assert(init_logging(lc, msg));
  lc.level = "chatty";
  assert(!init_logging(lc, msg));
  assert(msg == "unknown log level: chatty");
}

int main() {
  test_defaults_and_keys();
  test_errors_name_the_line();
  test_load_from_file();
  test_logging_init();
  return 0;
}
