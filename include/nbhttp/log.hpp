/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for nbhttp.
 * Provides NBHTTP_LOG_DEBUG, NBHTTP_LOG_INFO, NBHTTP_LOG_WARN, NBHTTP_LOG_ERROR macros.
 */

#ifndef NBHTTP_LOG_HPP_
#define NBHTTP_LOG_HPP_

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace nbhttp {

class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3, kOff = 4 };

  static void set_level(Level level) { min_level().store(static_cast<int>(level), std::memory_order_relaxed); }

  static Level level() { return static_cast<Level>(min_level().load(std::memory_order_relaxed)); }

  static bool enabled(Level level) {
    return level != Level::kOff && static_cast<int>(level) >= min_level().load(std::memory_order_relaxed);
  }

  static void log(Level level, const std::string& msg) {
    static const char* const kPrefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]", ""};
    if (!enabled(level))
      return;
    // Workers and processing threads log concurrently; keep lines whole
    std::lock_guard<std::mutex> lock(mutex());
    std::cerr << kPrefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

 private:
  static std::atomic<int>& min_level() {
    static std::atomic<int> level{static_cast<int>(Level::kInfo)};
    return level;
  }

  static std::mutex& mutex() {
    static std::mutex mu;
    return mu;
  }
};

#define NBHTTP_LOG_AT(lvl, msg)                    \
  do {                                             \
    if (::nbhttp::Logger::enabled(lvl)) {          \
      ::nbhttp::Logger::log(lvl, msg);             \
    }                                              \
  } while (0)

#define NBHTTP_LOG_DEBUG(msg) NBHTTP_LOG_AT(::nbhttp::Logger::Level::kDebug, msg)
#define NBHTTP_LOG_INFO(msg) NBHTTP_LOG_AT(::nbhttp::Logger::Level::kInfo, msg)
#define NBHTTP_LOG_WARN(msg) NBHTTP_LOG_AT(::nbhttp::Logger::Level::kWarn, msg)
#define NBHTTP_LOG_ERROR(msg) NBHTTP_LOG_AT(::nbhttp::Logger::Level::kError, msg)

}  // namespace nbhttp

#endif  // NBHTTP_LOG_HPP_
