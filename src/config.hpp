#pragma once
/*
 * Config
 *
 * Compile time: pick the backend the demo renders to with TF_BACKEND.
 * Run time: rc file ($HOME/.ttyframerc by default), one option per line:
 *
 *   # comment            " also a comment
 *   set viewport fixed:0,0,40,12
 *   set log_level=debug
 *   :set color off
 *
 * Keys: viewport, frame_count, color, log_level, log_file, fps, frames.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "renderer.hpp"

#define TF_BACKEND_NCURSES  1
#define TF_BACKEND_HEADLESS 2

#ifndef TF_BACKEND
#define TF_BACKEND TF_BACKEND_NCURSES
#endif

#if TF_BACKEND == TF_BACKEND_NCURSES
#define TF_BACKEND_NAME "ncurses"
#elif TF_BACKEND == TF_BACKEND_HEADLESS
#define TF_BACKEND_NAME "headless"
#else
#define TF_BACKEND_NAME "unknown"
#endif

struct LogConfig {
  std::string level = "info";
  std::string file; // empty: logging goes nowhere
};

struct Config {
  RendererOptions renderer{};
  bool color = true;
  LogConfig log{};
  int fps = 20;
  int frames = 200; // 0 = until interrupted
};

std::optional<std::filesystem::path> default_config_path();
// origin names the source in error messages ("<file>:<line>: ...")
bool parse_config_lines(const std::vector<std::string>& lines, const std::string& origin, Config& cfg, std::string& msg);
bool load_config(const std::filesystem::path& path, Config& cfg, std::string& msg);
// a missing default rc file is not an error
bool load_default_config(Config& cfg, std::string& msg);
