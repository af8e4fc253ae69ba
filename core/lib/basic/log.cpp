// awkls/basic/log.cpp - Process logger setup
#include "awkls/basic/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace awkls
{

std::shared_ptr<spdlog::logger> init_logging(spdlog::level::level_enum level)
{
  const std::string name(k_logger_name);
  auto logger = spdlog::get(name);
  if (!logger) {
    logger = spdlog::stderr_color_mt(name);
  }
  logger->set_level(level);
  logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_default_logger(logger);
  return logger;
}

spdlog::level::level_enum parse_log_level(std::string_view name)
{
  const auto level = spdlog::level::from_str(std::string(name));
  if (level == spdlog::level::off && name != "off") {
    return spdlog::level::info;
  }
  return level;
}

}  // namespace awkls
