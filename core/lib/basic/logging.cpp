// driftscan/basic/logging.cpp - Default logger setup
#include "driftscan/basic/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstring>
#include <memory>

namespace driftscan
{

void init_logging(spdlog::level::level_enum level, bool use_color)
{
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(
    use_color ? spdlog::color_mode::automatic : spdlog::color_mode::never);
  auto logger = std::make_shared<spdlog::logger>("driftscan", std::move(sink));
  logger->set_level(level);
  logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_default_logger(std::move(logger));
}

spdlog::level::level_enum parse_log_level(const char * name)
{
  if (name == nullptr) return spdlog::level::info;
  const auto level = spdlog::level::from_str(name);
  // from_str() maps unknown names to "off"
  if (level == spdlog::level::off && std::strcmp(name, "off") != 0) {
    return spdlog::level::info;
  }
  return level;
}

}  // namespace driftscan
