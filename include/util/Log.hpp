/**
 * @file Log.hpp
 * @brief spdlog setup. Messages carry a "[Tag]" prefix per component.
 */
#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace Util {

bool parseLogLevel(const std::string& name, spdlog::level::level_enum& out);

// Installs the stderr logger. Returns false (and falls back to info) for an unknown level.
bool initLogging(const std::string& level);

}  // namespace Util
