// Copyright 2021 The Safe-Extract Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SAFE_EXTRACT_LOG_H_
#define SAFE_EXTRACT_LOG_H_

#include <syslog.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <ostream>
#include <sstream>
#include <string_view>
#include <utility>

namespace safe_extract {

// Timer for debug logs.
struct Timer {
  using Clock = std::chrono::steady_clock;

  // Start time.
  Clock::time_point start = Clock::now();

  // Resets this timer.
  void Reset() { start = Clock::now(); }

  // Elapsed time in milliseconds.
  auto Milliseconds() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                                 start)
        .count();
  }

  friend std::ostream& operator<<(std::ostream& out, const Timer& timer) {
    return out << timer.Milliseconds() << " ms";
  }
};

enum class LogLevel {
  DEBUG = LOG_DEBUG,
  INFO = LOG_INFO,
  WARNING = LOG_WARNING,
  ERROR = LOG_ERR,
};

extern LogLevel g_log_level;

void SetLogLevel(LogLevel level);

#define LOG_IS_ON(level) \
  (::safe_extract::LogLevel::level <= ::safe_extract::g_log_level)

// Was the latest log message an ephemeral progress message?
extern std::atomic<bool> g_latest_log_is_ephemeral;

// Progress message, such as "Extracting 42%". On a terminal, the next log
// message overwrites it.
struct ProgressMessage {
  std::string_view verb;
  int percent;
};

// Accumulates a log message and logs it.
class Logger {
 public:
  explicit Logger(LogLevel const level, int err = -1)
      : level_(level), err_(err) {}

  Logger(const Logger&) = delete;

  ~Logger();

  Logger&& operator<<(const auto& a) && {
    oss_ << a;
    return std::move(*this);
  }

  Logger&& operator<<(ProgressMessage const a) && {
    oss_ << a.verb << " " << a.percent << "%";
    ephemeral_ = true;
    return std::move(*this);
  }

 private:
  LogLevel const level_;
  int const err_;
  std::ostringstream oss_;
  bool ephemeral_ = false;
};

#define LOG(level) \
  if (LOG_IS_ON(level)) ::safe_extract::Logger(::safe_extract::LogLevel::level)

#define PLOG(level)     \
  if (LOG_IS_ON(level)) \
  ::safe_extract::Logger(::safe_extract::LogLevel::level, errno)

}  // namespace safe_extract

#endif  // SAFE_EXTRACT_LOG_H_
