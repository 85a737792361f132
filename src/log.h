#pragma once

#include "linkpair/linkpair.h"

#include <string>

namespace linkpair {
namespace detail {

// Route a log line to the configured callback, or stderr.
void Log(const std::string& message, const Config::LogCallback& callback);

// Log that a user callback threw.
void LogCallbackError(const char* name, const Config::LogCallback& callback);

}  // namespace detail
}  // namespace linkpair
