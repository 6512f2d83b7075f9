#include "logging.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace spockscan::driver {

auto MakeLogger(int verbosity, std::string_view configured_level)
    -> std::shared_ptr<spdlog::logger> {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("spockscan", sink);
  logger->set_pattern("%n: %^%l%$: %v");

  auto level = configured_level.empty()
                   ? spdlog::level::warn
                   : spdlog::level::from_str(std::string(configured_level));
  if (verbosity >= 2) {
    level = std::min(level, spdlog::level::debug);
  } else if (verbosity == 1) {
    level = std::min(level, spdlog::level::info);
  }
  logger->set_level(level);
  return logger;
}

}  // namespace spockscan::driver
