/**
 * @file   logger.h
 *
 * @section LICENSE
 *
 * The MIT License
 *
 * @copyright Copyright (c) 2024 TileDB, Inc.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 *
 * @section DESCRIPTION
 *
 * This file defines class Logger, the process-wide spdlog logger, and the
 * LOG_* helpers used by the library and the tool.
 */

#ifndef SIMPLEVCF_LOGGER_H
#define SIMPLEVCF_LOGGER_H

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <string>

namespace simplevcf {
namespace common {

/**
 * Wraps the "simplevcf" spdlog logger. Messages go to stderr and, after
 * set_logfile(), to a file as well.
 */
class Logger {
 public:
  /** Verbosity level, from least to most verbose. */
  enum class Level : char {
    FATAL,
    ERR,
    WARN,
    INFO,
    DBG,
    TRACE,
  };

  Logger();

  ~Logger();

  /**
   * Logs a message at the given level. With arguments, `format` is a fmtlib
   * format string; without, it is logged as is. Formatting is skipped when
   * the level is disabled.
   */
  template <typename... Args>
  void log(Level lvl, const char* format, const Args&... args) {
    if (!is_logging(lvl))
      return;
    if constexpr (sizeof...(Args) == 0)
      write(lvl, format);
    else
      write(lvl, fmt::format(fmt::runtime(format), args...));
  }

  void set_level(Level lvl);

  /**
   * Sets the level from its name: "fatal", "error", "warn", "info", "debug"
   * or "trace" (case insensitive).
   *
   * @throws std::invalid_argument if the name is not recognized.
   */
  void set_level(const std::string& lvl);

  /**
   * Additionally writes all messages to the given file, appending if it
   * exists. Calling this again replaces the previous file.
   */
  void set_logfile(const std::string& filename);

  /** True if messages of the given level are emitted. */
  bool is_logging(Level lvl) const;

 private:
  void write(Level lvl, const std::string& msg);

  static spdlog::level::level_enum to_spdlog(Level lvl);

  std::shared_ptr<spdlog::logger> logger_;
};

/** The process-wide logger. */
Logger& global_logger();

inline void LOG_SET_LEVEL(const std::string& lvl) {
  global_logger().set_level(lvl);
}

inline void LOG_SET_FILE(const std::string& filename) {
  global_logger().set_logfile(filename);
}

inline bool LOG_DEBUG_ENABLED() {
  return global_logger().is_logging(Logger::Level::DBG);
}

template <typename... Args>
inline void LOG_TRACE(const char* format, const Args&... args) {
  global_logger().log(Logger::Level::TRACE, format, args...);
}

template <typename... Args>
inline void LOG_DEBUG(const char* format, const Args&... args) {
  global_logger().log(Logger::Level::DBG, format, args...);
}

template <typename... Args>
inline void LOG_INFO(const char* format, const Args&... args) {
  global_logger().log(Logger::Level::INFO, format, args...);
}

template <typename... Args>
inline void LOG_WARN(const char* format, const Args&... args) {
  global_logger().log(Logger::Level::WARN, format, args...);
}

/** Logs a critical error and exits with a non-zero status. */
template <typename... Args>
[[noreturn]] inline void LOG_FATAL(const char* format, const Args&... args) {
  global_logger().log(Logger::Level::FATAL, format, args...);
  exit(1);
}

}  // namespace common
}  // namespace simplevcf

#endif  // SIMPLEVCF_LOGGER_H
