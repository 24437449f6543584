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

#include "error.h"

#include <system_error>

namespace safe_extract {
namespace {

// Can be called from worker threads.
std::string FormatMessage(std::string const& message, int const err) {
  if (err == 0) {
    return message;
  }

  return StrCat(message, ": ", std::generic_category().message(err));
}

}  // namespace

std::ostream& operator<<(std::ostream& out, ExitCode const e) {
  switch (e) {
#define PRINT(s)    \
  case ExitCode::s: \
    return out << #s << " (" << int(ExitCode::s) << ")";
    PRINT(GENERIC_FAILURE)
    PRINT(CANNOT_CREATE_OUTPUT_DIR)
    PRINT(CANNOT_OPEN_ARCHIVE)
    PRINT(UNKNOWN_ARCHIVE_FORMAT)
    PRINT(INVALID_ARCHIVE_HEADER)
    PRINT(INVALID_ARCHIVE_CONTENTS)
    PRINT(PARTIAL_EXTRACTION)
#undef PRINT
  }

  return out << "Exit Code " << int(e);
}

std::ostream& operator<<(std::ostream& out, ErrorKind const k) {
  switch (k) {
    case ErrorKind::CatalogAccess:
      return out << "Catalog access error";
    case ErrorKind::Filesystem:
      return out << "Filesystem error";
    case ErrorKind::Stream:
      return out << "Stream error";
  }

  return out << "Error kind " << int(k);
}

Error::Error(ErrorKind const kind, std::string const& message, int const err)
    : std::runtime_error(FormatMessage(message, err)), kind_(kind), err_(err) {}

}  // namespace safe_extract
