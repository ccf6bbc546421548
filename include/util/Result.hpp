/**
 * @file Result.hpp
 * @brief Result struct shared by every module that can fail.
 */
#pragma once

#include <string>

namespace Util {

struct ActionResult {
  bool ok = false;
  std::string message;
};

inline ActionResult success(const std::string& message = std::string()) {
  ActionResult res;
  res.ok = true;
  res.message = message;
  return res;
}

inline ActionResult failure(const std::string& message) {
  ActionResult res;
  res.ok = false;
  res.message = message;
  return res;
}

}  // namespace Util
