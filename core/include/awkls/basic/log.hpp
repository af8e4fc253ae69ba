// awkls/basic/log.hpp - Process logger setup
#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace awkls
{

/// Name of the logger registered by init_logging()
inline constexpr std::string_view k_logger_name = "awkls";

/**
 * Create the process logger and install it as spdlog's default logger.
 *
 * The logger always writes to stderr: the language server uses stdout for
 * protocol traffic.
 */
std::shared_ptr<spdlog::logger> init_logging(spdlog::level::level_enum level);

/// Parse "trace", "debug", "info", "warn", "error" or "off"; unknown names give info
[[nodiscard]] spdlog::level::level_enum parse_log_level(std::string_view name);

}  // namespace awkls
