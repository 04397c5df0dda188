#include "config.hpp"
#include "cmd_registry.hpp"
#include "file_reader.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

template <typename T>
static bool parse_number(const std::string& s, T& out) {
  if (s.empty()) return false;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && p == s.data() + s.size();
}

static bool parse_on_off(const std::string& s, bool& out) {
  if (s == "on" || s == "true" || s == "1") { out = true; return true; }
  if (s == "off" || s == "false" || s == "0") { out = false; return true; }
  return false;
}

// "fullscreen" or "fixed:X,Y,W,H"
static bool parse_viewport(const std::string& s, Viewport& out) {
  if (s == "fullscreen") { out = Viewport{}; return true; }
  const std::string prefix = "fixed:";
  if (s.rfind(prefix, 0) != 0) return false;
  std::vector<int> nums;
  std::stringstream ss(s.substr(prefix.size()));
  std::string part;
  while (std::getline(ss, part, ',')) {
    int v = 0;
    if (!parse_number(trim(part), v)) return false;
    nums.push_back(v);
  }
  if (nums.size() != 4 || nums[2] <= 0 || nums[3] <= 0 || nums[0] < 0 || nums[1] < 0) return false;
  out.kind = ViewportKind::Fixed;
  out.area = Rect{nums[0], nums[1], nums[2], nums[3]};
  return true;
}

static void register_options(CommandRegistry& registry, Config& cfg) {
  registry.register_command("viewport", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1 || !parse_viewport(args[0], cfg.renderer.viewport)) {
      msg = "viewport: use fullscreen or fixed:X,Y,W,H";
      return false;
    }
    return true;
  });
  registry.register_command("frame_count", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1 || !parse_number(args[0], cfg.renderer.initial_count)) {
      msg = "frame_count: value must be an unsigned number";
      return false;
    }
    return true;
  });
  registry.register_command("color", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.size() != 1 || !parse_on_off(args[0], cfg.color)) { msg = "color: value must be on|off"; return false; }
    return true;
  });
  registry.register_command("log_level", [&cfg](const std::vector<std::string>& args, std::string& msg){
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "off"};
    if (args.size() != 1 || std::find(std::begin(levels), std::end(levels), args[0]) == std::end(levels)) {
      msg = "log_level: use trace|debug|info|warn|error|off";
      return false;
    }
    cfg.log.level = args[0];
    return true;
  });
  registry.register_command("log_file", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.size() > 1) { msg = "log_file: expects one path"; return false; }
    cfg.log.file = args.empty() ? std::string() : args[0];
    return true;
  });
  registry.register_command("fps", [&cfg](const std::vector<std::string>& args, std::string& msg){
    int v = 0;
    if (args.size() != 1 || !parse_number(args[0], v) || v < 1 || v > 240) { msg = "fps: value must be 1..240"; return false; }
    cfg.fps = v;
    return true;
  });
  registry.register_command("frames", [&cfg](const std::vector<std::string>& args, std::string& msg){
    int v = 0;
    if (args.size() != 1 || !parse_number(args[0], v) || v < 0) { msg = "frames: value must be >= 0"; return false; }
    cfg.frames = v;
    return true;
  });
}

std::optional<std::filesystem::path> default_config_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::nullopt;
  return std::filesystem::path(home) / ".ttyframerc";
}

bool parse_config_lines(const std::vector<std::string>& lines, const std::string& origin, Config& cfg, std::string& msg) {
  Config parsed = cfg;
  CommandRegistry registry;
  register_options(registry, parsed);
  for (size_t ln = 0; ln < lines.size(); ++ln) {
    std::string s = trim(lines[ln]);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s[0] == ':') s = trim(s.substr(1));

    std::vector<std::string> tokens;
    std::istringstream in(s);
    for (std::string t; in >> t;) tokens.push_back(t);
    if (!tokens.empty() && tokens[0] == "set") tokens.erase(tokens.begin());
    if (tokens.empty()) continue;

    std::string key = tokens[0];
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());
    if (auto eq = key.find('='); eq != std::string::npos) {
      std::string value = key.substr(eq + 1);
      key = key.substr(0, eq);
      if (!value.empty()) args.insert(args.begin(), value);
    }

    std::string err;
    if (!registry.execute(key, args, err)) {
      msg = origin + ":" + std::to_string(ln + 1) + ": " + err;
      return false;
    }
    spdlog::debug("config: {} = {}", key, args.empty() ? std::string() : args[0]);
  }
  cfg = parsed;
  return true;
}

bool load_config(const std::filesystem::path& path, Config& cfg, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  return parse_config_lines(lines, path.string(), cfg, msg);
}

bool load_default_config(Config& cfg, std::string& msg) {
  auto p = default_config_path();
  if (!p) return true;
  std::error_code ec;
  if (!std::filesystem::exists(*p, ec)) return true;
  return load_config(*p, cfg, msg);
}
