// === Logging =================================================================
//
// Process-wide spdlog logger shared by every component. Call initialize_logger
// once at startup; components cache get_logger() at construction.

#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace airspace {

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

}  // namespace airspace
