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

#include "log.h"

#include <unistd.h>

#include <cstring>
#include <string>
#include <tuple>

namespace safe_extract {

LogLevel g_log_level = LogLevel::INFO;

std::atomic<bool> g_latest_log_is_ephemeral = false;

void SetLogLevel(LogLevel const level) {
  g_log_level = level;
  setlogmask(LOG_UPTO(static_cast<int>(level)));
}

Logger::~Logger() {
  if (err_ >= 0) {
    if (LOG_IS_ON(DEBUG)) {
      oss_ << ": Error " << err_;
    }
    oss_ << ": " << strerror(err_);
  }

  if (g_latest_log_is_ephemeral && isatty(STDERR_FILENO)) {
    std::string_view const s = "\e[F\e[K";
    std::ignore = write(STDERR_FILENO, s.data(), s.size());
  }

  syslog(static_cast<int>(level_), "%s", std::move(oss_).str().c_str());
  g_latest_log_is_ephemeral = ephemeral_;
}

}  // namespace safe_extract
