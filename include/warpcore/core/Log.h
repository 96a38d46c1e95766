#pragma once

#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace warpcore::core {

// Ordered: a threshold lets through its own level and everything above it.
enum class LogLevel : int { Trace, Debug, Info, Warn, Error, Off };

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Whether a message at `level` would be emitted.
bool logEnabled(LogLevel level);

std::string_view toString(LogLevel level);

// Accepts the names toString produces, in any case ("warn", "WARN").
std::optional<LogLevel> parseLogLevel(std::string_view name);

// "[HH:MM:SS.mmm][LEVEL] message", as written to the console.
std::string formatLogLine(LogLevel level, std::string_view message);

// While a sink is installed, messages that pass the level filter go to it
// instead of the console. The sink runs outside the logger lock and may log.
using LogSink = std::function<void(LogLevel, std::string_view)>;
void setLogSink(LogSink sink);
void clearLogSink();

void log(LogLevel level, std::string_view message);

} // namespace warpcore::core

// Stream-style logging; the message is only formatted when the level passes:
//   WARPCORE_LOG_DEBUG("WarpDrive: " << toString(phase) << " at " << t << "s");
#define WARPCORE_LOG(level, expr)                                       \
  do {                                                                  \
    if (::warpcore::core::logEnabled(level)) {                          \
      std::ostringstream warpcore_log_stream_;                          \
      warpcore_log_stream_ << expr;                                     \
      ::warpcore::core::log((level), warpcore_log_stream_.str());       \
    }                                                                   \
  } while (0)

#define WARPCORE_LOG_TRACE(expr) WARPCORE_LOG(::warpcore::core::LogLevel::Trace, expr)
#define WARPCORE_LOG_DEBUG(expr) WARPCORE_LOG(::warpcore::core::LogLevel::Debug, expr)
#define WARPCORE_LOG_INFO(expr)  WARPCORE_LOG(::warpcore::core::LogLevel::Info, expr)
#define WARPCORE_LOG_WARN(expr)  WARPCORE_LOG(::warpcore::core::LogLevel::Warn, expr)
#define WARPCORE_LOG_ERROR(expr) WARPCORE_LOG(::warpcore::core::LogLevel::Error, expr)
