// Copyright 2023 JT
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <cstdarg>
#include <cstdint>
#include <memory>
#include <mutex>

namespace cballot {

enum LogLevel : uint8_t {
  kDebug,
  kInfo,
  kWarning,
  kError,
  kFatal,
};

const char* LogLevelName(LogLevel level);

class Logger {
 public:
  Logger(LogLevel log_level) : log_level_(log_level) {}
  virtual ~Logger() = default;

  void Log(LogLevel level, const char* format, ...);
  virtual void Logv(LogLevel level, const char* format, va_list ap) = 0;

  bool Enabled(LogLevel level) const { return level >= log_level_; }

  LogLevel GetLogLevel() const { return log_level_; }
  void SetLogLevel(LogLevel level) { log_level_ = level; }

 private:
  LogLevel log_level_;
};

// ConsoleLogger writes one colored, level-prefixed line per message to
// stdout. Unlike a fatal log in a long running node, a fatal message here
// does not abort: the counters report failures through Status.
class ConsoleLogger : public Logger {
 public:
  ConsoleLogger(LogLevel log_level = LogLevel::kWarning)
      : Logger(log_level) {}

  void Logv(LogLevel level, const char* format, va_list ap) override;

 private:
  const char* GetPrefix(LogLevel level);

  std::mutex lock_;
};

using LoggerPtr = std::shared_ptr<Logger>;

#define CBALLOT_LOG_DEBUG(logger, format, ...) \
  logger->Log(::cballot::LogLevel::kDebug, format, ##__VA_ARGS__)

#define CBALLOT_LOG_INFO(logger, format, ...) \
  logger->Log(::cballot::LogLevel::kInfo, format, ##__VA_ARGS__)

#define CBALLOT_LOG_WARNING(logger, format, ...) \
  logger->Log(::cballot::LogLevel::kWarning, format, ##__VA_ARGS__)

#define CBALLOT_LOG_ERROR(logger, format, ...) \
  logger->Log(::cballot::LogLevel::kError, format, ##__VA_ARGS__)

#define CBALLOT_LOG_FATAL(logger, format, ...) \
  logger->Log(::cballot::LogLevel::kFatal, format, ##__VA_ARGS__)

}  // namespace cballot
