#include "util/Log.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace Util {

bool parseLogLevel(const std::string& name, spdlog::level::level_enum& out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "trace") { out = spdlog::level::trace; return true; }
  if (lower == "debug") { out = spdlog::level::debug; return true; }
  if (lower == "info") { out = spdlog::level::info; return true; }
  if (lower == "warn" || lower == "warning") { out = spdlog::level::warn; return true; }
  if (lower == "error") { out = spdlog::level::err; return true; }
  if (lower == "off") { out = spdlog::level::off; return true; }
  return false;
}

bool initLogging(const std::string& level) {
  auto logger = spdlog::get("wifi-portal");
  if (!logger) {
    logger = spdlog::stderr_color_mt("wifi-portal");
  }
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  spdlog::level::level_enum parsed = spdlog::level::info;
  bool known = parseLogLevel(level, parsed);
  spdlog::set_level(parsed);
  if (!known) {
    spdlog::warn("[Log] Unknown log level '{}', using info", level);
  }
  return known;
}

}  // namespace Util
