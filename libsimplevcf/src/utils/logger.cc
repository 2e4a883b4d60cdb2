/**
 * @file   logger.cc
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
 * This file implements class Logger.
 */

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "utils/logger.h"

namespace simplevcf {
namespace common {

namespace {
const char* const LOGGER_NAME = "simplevcf";
const char* const LOG_PATTERN =
    "[%Y-%m-%d %H:%M:%S.%e] [%n] [Process: %P] [Thread: %t] [%l] %v";
}  // namespace

Logger::Logger() {
  logger_ = spdlog::get(LOGGER_NAME);
  if (logger_ == nullptr)
    logger_ = spdlog::stderr_color_mt(LOGGER_NAME);
  logger_->set_pattern(LOG_PATTERN);
  set_level(Level::ERR);
}

Logger::~Logger() {
  spdlog::drop(LOGGER_NAME);
}

spdlog::level::level_enum Logger::to_spdlog(Level lvl) {
  switch (lvl) {
    case Level::FATAL:
      return spdlog::level::critical;
    case Level::ERR:
      return spdlog::level::err;
    case Level::WARN:
      return spdlog::level::warn;
    case Level::INFO:
      return spdlog::level::info;
    case Level::DBG:
      return spdlog::level::debug;
    case Level::TRACE:
      return spdlog::level::trace;
  }
  throw std::invalid_argument("Unsupported log level");
}

void Logger::set_level(Level lvl) {
  logger_->set_level(to_spdlog(lvl));
}

bool Logger::is_logging(Level lvl) const {
  return logger_->should_log(to_spdlog(lvl));
}

void Logger::write(Level lvl, const std::string& msg) {
  logger_->log(to_spdlog(lvl), spdlog::string_view_t(msg));
}

void Logger::set_level(const std::string& lvl) {
  std::string name(lvl);
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (name == "fatal" || name == "critical") {
    set_level(Level::FATAL);
  } else if (name == "error") {
    set_level(Level::ERR);
  } else if (name == "warn" || name == "warning") {
    set_level(Level::WARN);
  } else if (name == "info") {
    set_level(Level::INFO);
  } else if (name == "debug") {
    set_level(Level::DBG);
  } else if (name == "trace") {
    set_level(Level::TRACE);
  } else {
    throw std::invalid_argument("Unsupported log level '" + lvl + "'");
  }
}

void Logger::set_logfile(const std::string& filename) {
  auto& sinks = logger_->sinks();
  // Keep the console sink (always first), replace any previous file sink.
  if (sinks.size() > 1)
    sinks.resize(1);

  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
  file_sink->set_pattern(LOG_PATTERN);
  sinks.push_back(file_sink);
  logger_->flush_on(spdlog::level::err);
  log(Level::INFO, "Logging to file '{}'", filename);
}

Logger& global_logger() {
  static Logger l;
  return l;
}

}  // namespace common
}  // namespace simplevcf
