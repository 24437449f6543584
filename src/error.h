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

#ifndef SAFE_EXTRACT_ERROR_H_
#define SAFE_EXTRACT_ERROR_H_

#include <cstdint>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace safe_extract {

// Type alias for shorter code.
using i64 = std::int64_t;

template <typename... Args>
std::string StrCat(Args&&... args) {
  std::ostringstream out;
  (out << ... << std::forward<Args>(args));
  return std::move(out).str();
}

// ---- Exit Codes

// These are values passed to the exit function, or returned by main. These are
// (Linux or Linux-like) application exit codes, not library error codes.
enum class ExitCode {
  GENERIC_FAILURE = 1,
  CANNOT_CREATE_OUTPUT_DIR = 10,
  CANNOT_OPEN_ARCHIVE = 11,
  UNKNOWN_ARCHIVE_FORMAT = 30,
  INVALID_ARCHIVE_HEADER = 31,
  INVALID_ARCHIVE_CONTENTS = 32,
  PARTIAL_EXTRACTION = 40,
};

std::ostream& operator<<(std::ostream& out, ExitCode e);

// ---- Entry Errors

// What went wrong while extracting a single archive entry.
enum class ErrorKind {
  // The catalog could not yield the entry's metadata or its data stream.
  CatalogAccess,
  // Creating a directory, creating a file or writing to it failed.
  Filesystem,
  // The entry's data stream failed or ended prematurely.
  Stream,
};

std::ostream& operator<<(std::ostream& out, ErrorKind k);

// Error affecting a single archive entry. It is recorded against that entry
// and does not stop the extraction of the other entries.
class Error : public std::runtime_error {
 public:
  // If `err` is not zero, it is an errno value whose description is appended
  // to the message.
  Error(ErrorKind kind, std::string const& message, int err = 0);

  ErrorKind kind() const { return kind_; }
  int err() const { return err_; }

 private:
  ErrorKind const kind_;
  int const err_;
};

}  // namespace safe_extract

#endif  // SAFE_EXTRACT_ERROR_H_
