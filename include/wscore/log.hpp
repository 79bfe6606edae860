/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for wscore.
 * Provides WSCORE_LOG_DEBUG, WSCORE_LOG_INFO, WSCORE_LOG_WARN, WSCORE_LOG_ERROR
 * macros. Messages below the current level are not formatted.
 */

#ifndef WSCORE_LOG_HPP_
#define WSCORE_LOG_HPP_

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace wscore {

class Logger {
 public:
  enum class Level { kDebug = 0, kInfo, kWarn, kError, kOff };

  static void set_level(Level level) { level_.store(level, std::memory_order_relaxed); }
  static Level level() { return level_.load(std::memory_order_relaxed); }

  static bool enabled(Level level) {
    return level != Level::kOff &&
           static_cast<int>(level) >= static_cast<int>(Logger::level());
  }

  static void log(Level level, const std::string& msg) {
    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]", ""};
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << "[wscore] " << prefix[static_cast<int>(level)] << " " << msg
              << std::endl;
  }

 private:
  static inline std::atomic<Level> level_{Level::kInfo};
  static inline std::mutex mutex_;
};

#define WSCORE_LOG_AT(lvl, msg)                            \
  do {                                                     \
    if (::wscore::Logger::enabled(lvl)) {                  \
      ::wscore::Logger::log(lvl, msg);                     \
    }                                                      \
  } while (0)

#define WSCORE_LOG_DEBUG(msg) WSCORE_LOG_AT(::wscore::Logger::Level::kDebug, msg)
#define WSCORE_LOG_INFO(msg) WSCORE_LOG_AT(::wscore::Logger::Level::kInfo, msg)
#define WSCORE_LOG_WARN(msg) WSCORE_LOG_AT(::wscore::Logger::Level::kWarn, msg)
#define WSCORE_LOG_ERROR(msg) WSCORE_LOG_AT(::wscore::Logger::Level::kError, msg)

}  // namespace wscore

#endif  // WSCORE_LOG_HPP_
