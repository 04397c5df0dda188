#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

bool init_logging(const LogConfig& cfg, std::string& msg) {
  auto level = spdlog::level::from_str(cfg.level);
  if (level == spdlog::level::off && cfg.level != "off") {
    msg = "unknown log level: " + cfg.level;
    return false;
  }
  std::shared_ptr<spdlog::logger> logger;
  spdlog::drop("ttyframe");
  try {
    if (cfg.file.empty()) logger = spdlog::null_logger_mt("ttyframe");
    else logger = spdlog::basic_logger_mt("ttyframe", cfg.file);
  } catch (const spdlog::spdlog_ex& e) {
    msg = std::string("log init failed: ") + e.what();
    return false;
  }
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
  spdlog::info("ttyframe: logging at {} to {}", cfg.level, cfg.file.empty() ? "null sink" : cfg.file);
  return true;
}
