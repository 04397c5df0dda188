#pragma once
/*
 * Logging
 *
 * Purpose: install the process-wide spdlog logger from LogConfig.
 * Sinks: a file when log_file is set; otherwise a null sink, because stdout
 *        belongs to the screen while the renderer runs.
 */
#include <string>
#include "config.hpp"

bool init_logging(const LogConfig& cfg, std::string& msg);
