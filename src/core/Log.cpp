#include "warpcore/core/Log.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <utility>

namespace warpcore::core {
namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};

// Console writes are serialized; the sink is swapped under the same lock.
std::mutex g_mutex;
std::shared_ptr<const LogSink> g_sink;

std::tm toLocal(std::time_t t) {
  std::tm out{};
#if defined(_WIN32)
  localtime_s(&out, &t);
#else
  localtime_r(&t, &out);
#endif
  return out;
}

} // namespace

void setLogLevel(LogLevel level) { g_level.store(level); }
LogLevel getLogLevel() { return g_level.load(); }

bool logEnabled(LogLevel level) {
  const LogLevel threshold = g_level.load();
  return threshold != LogLevel::Off && level != LogLevel::Off && level >= threshold;
}

std::string_view toString(LogLevel level) {
  switch (level) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
  }
  return "UNKNOWN";
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
  std::string upper(name);
  for (char& c : upper) c = (char)std::toupper((unsigned char)c);

  for (LogLevel l : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::Off}) {
    if (upper == toString(l)) return l;
  }
  return std::nullopt;
}

std::string formatLogLine(LogLevel level, std::string_view message) {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::tm tm = toLocal(system_clock::to_time_t(now));
  const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

  std::ostringstream oss;
  oss << "[" << std::put_time(&tm, "%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms << "]"
      << "[" << toString(level) << "] " << message;
  return oss.str();
}

void setLogSink(LogSink sink) {
  auto next = sink ? std::make_shared<const LogSink>(std::move(sink)) : nullptr;
  std::lock_guard<std::mutex> lock(g_mutex);
  g_sink = std::move(next);
}

void clearLogSink() {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_sink.reset();
}

void log(LogLevel level, std::string_view message) {
  if (!logEnabled(level)) return;

  std::shared_ptr<const LogSink> sink;
  {
    std::lock_guard<std::mutex> lock(g_mutex);
    sink = g_sink;
  }
  if (sink) {
    (*sink)(level, message);
    return;
  }

  const std::string line = formatLogLine(level, message);
  std::lock_guard<std::mutex> lock(g_mutex);
  std::ostream& os = (level >= LogLevel::Warn) ? std::cerr : std::cout;
  os << line << "\n";
}

} // namespace warpcore::core
