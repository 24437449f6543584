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

#ifndef SAFE_EXTRACT_PATH_H_
#define SAFE_EXTRACT_PATH_H_

#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace safe_extract {

// Should paths be redacted from log messages?
extern bool g_redact;

// Path manipulations.
class Path : public std::string_view {
 public:
  Path() = default;
  Path(const char* const path) : std::string_view(path) {}
  Path(std::string_view const path) : std::string_view(path) {}

  // Removes trailing separators.
  Path WithoutTrailingSeparator() const;

  // Gets a safe truncation position `x` such that `0 <= x && x <= i`. Avoids
  // truncating in the middle of a multi-byte UTF-8 sequence. Returns `size()`
  // if `i >= size()`.
  size_type TruncationPosition(size_type i) const;

  // Splits path between parent path and basename.
  std::pair<Path, Path> Split() const;

  // Appends the |tail| path to |*head|. If |tail| is an absolute path, then
  // |*head| takes the value of |tail|. If |tail| is a relative path, then it is
  // appended to |*head|. A '/' separator is added if |*head| doesn't already
  // end with one.
  static void Append(std::string* head, std::string_view tail);
};

// Prints a path between single quotes, escaping control characters. Prints
// "(redacted)" instead if g_redact is set.
std::ostream& operator<<(std::ostream& out, Path path);

// Relative path made of segments that are safe to create under an output
// directory. Each segment is non-empty, is neither "." nor "..", and contains
// no '/' or '\' separator.
class SanitizedPath {
 public:
  SanitizedPath() = default;
  explicit SanitizedPath(std::vector<std::string> segments)
      : segments_(std::move(segments)) {}

  const std::vector<std::string>& segments() const { return segments_; }
  bool empty() const { return segments_.empty(); }

  // Segments joined with '/'. Empty if there is no segment.
  std::string str() const;

  // Joins this relative path under `root`. The result is `root` itself if this
  // path is empty, and is always lexically inside `root`.
  std::string JoinUnder(std::string_view root) const;

  friend bool operator==(const SanitizedPath&,
                         const SanitizedPath&) = default;

 private:
  std::vector<std::string> segments_;
};

std::ostream& operator<<(std::ostream& out, const SanitizedPath& path);

// Sanitizes a single file name. The result contains no separator and no
// character that is illegal in a portable file name, is not a reserved device
// name, and is at most NAME_MAX bytes long. Returns an empty string if nothing
// usable remains, e.g. for "", "." or "..".
std::string SanitizeSegment(std::string_view name);

// Converts an untrusted archive entry name into a safe relative path:
// * Backslashes are treated as separators.
// * Empty segments (leading, trailing or doubled separators) are dropped.
// * Segments made of dots only ("." and "..") are dropped.
// * Each remaining segment goes through SanitizeSegment().
//
// Never fails. The result can be empty.
SanitizedPath Sanitize(std::string_view name);

}  // namespace safe_extract

#endif  // SAFE_EXTRACT_PATH_H_
