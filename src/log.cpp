#include "log.h"

#include <iostream>

namespace linkpair {
namespace detail {

void Log(const std::string& message, const Config::LogCallback& callback) {
  if (callback) {
    callback(message);
    return;
  }
  std::cerr << "[linkpair] " << message << std::endl;
}

void LogCallbackError(const char* name, const Config::LogCallback& callback) {
  std::string message = "callback threw exception: ";
  message += name;
  Log(message, callback);
}

}  // namespace detail
}  // namespace linkpair
