#pragma once

#include <functional>
#include <string>

namespace eematrix::store {

// Levels for the logging callback
enum class LogLevel { debug = 0, info, warning, error };

using logger_callable = std::function<void(LogLevel lvl, std::string msg)>;

}  // namespace eematrix::store
