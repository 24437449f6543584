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

#include "path.h"

#include <algorithm>
#include <cassert>
#include <cctype>
#include <climits>
#include <iomanip>
#include <unordered_set>

namespace safe_extract {

bool g_redact = false;

namespace {

// Converts a string to ASCII lower case.
std::string ToLower(std::string_view const s) {
  std::string r(s);
  for (char& c : r) {
    if ('A' <= c && c <= 'Z')
      c += 'a' - 'A';
  }

  return r;
}

// Characters that cannot appear in a portable file name. This includes the
// ASCII control characters (including NUL) and both separators.
bool IsIllegalChar(char const c) {
  switch (c) {
    case '/':
    case '\\':
    case '<':
    case '>':
    case ':':
    case '"':
    case '|':
    case '?':
    case '*':
      return true;
    default:
      return static_cast<unsigned char>(c) < 0x20;
  }
}

// Is `c` the second byte of the UTF-8 encoding of a C1 control character
// (U+0080 to U+009F)? These are encoded as C2 80 to C2 9F.
bool IsC1Trailer(char const c) {
  unsigned char const u = static_cast<unsigned char>(c);
  return 0x80 <= u && u <= 0x9F;
}

// Windows drops trailing dots and spaces from file names.
void RemoveTrailingDotsAndSpaces(std::string& s) {
  while (!s.empty() && (s.back() == '.' || s.back() == ' '))
    s.pop_back();
}

// Checks if `name` is a reserved DOS device name, with or without extension.
// Eg "CON", "nul.txt", "Com1.tar.gz".
bool IsReservedName(std::string_view const name) {
  static std::unordered_set<std::string_view> const reserved = {
      "con",  "prn",  "aux",  "nul",  "com1", "com2", "com3", "com4",
      "com5", "com6", "com7", "com8", "com9", "lpt1", "lpt2", "lpt3",
      "lpt4", "lpt5", "lpt6", "lpt7", "lpt8", "lpt9"};

  std::string_view const stem = name.substr(0, name.find('.'));
  return stem.size() <= 4 && reserved.contains(ToLower(stem));
}

}  // namespace

Path Path::WithoutTrailingSeparator() const {
  Path path = *this;

  // Don't remove the first character, even if it is a '/'.
  while (path.size() > 1 && path.back() == '/')
    path.remove_suffix(1);

  return path;
}

Path::size_type Path::TruncationPosition(size_type i) const {
  if (i >= size())
    return size();

  while (true) {
    // Avoid truncating at a UTF-8 trailing byte.
    while (i > 0 && (at(i) & 0b1100'0000) == 0b1000'0000)
      --i;

    if (i == 0)
      return i;

    std::string_view const zero_width_joiner = "\u200D";

    // Avoid truncating at a zero-width joiner.
    if (substr(i).starts_with(zero_width_joiner)) {
      --i;
      continue;
    }

    // Avoid truncating just after a zero-width joiner.
    if (substr(0, i).ends_with(zero_width_joiner)) {
      i -= zero_width_joiner.size();
      if (i > 0) {
        --i;
        continue;
      }
    }

    return i;
  }
}

std::pair<Path, Path> Path::Split() const {
  std::string_view::size_type const i = find_last_of('/') + 1;
  return {Path(substr(0, i)).WithoutTrailingSeparator(), substr(i)};
}

void Path::Append(std::string* const head, std::string_view const tail) {
  assert(head);

  if (tail.empty())
    return;

  if (head->empty() || tail.starts_with('/')) {
    *head = tail;
    return;
  }

  assert(!head->empty());
  assert(!tail.empty());

  if (!head->ends_with('/'))
    *head += '/';

  *head += tail;
}

std::ostream& operator<<(std::ostream& out, Path const path) {
  if (g_redact)
    return out << "(redacted)";

  out.put('\'');
  for (char const c : path) {
    switch (c) {
      case '\\':
      case '\'':
        out.put('\\');
        out.put(c);
        break;
      default:
        int const i = static_cast<unsigned char>(c);
        if (std::iscntrl(i)) {
          out << "\\x" << std::hex << std::setw(2) << std::setfill('0') << i
              << std::dec;
        } else {
          out.put(c);
        }
    }
  }

  out.put('\'');
  return out;
}

std::string SanitizedPath::str() const {
  std::string result;
  for (const std::string& segment : segments_) {
    if (!result.empty())
      result += '/';
    result += segment;
  }

  return result;
}

std::string SanitizedPath::JoinUnder(std::string_view const root) const {
  std::string result(root);
  Path::Append(&result, str());
  return result;
}

std::ostream& operator<<(std::ostream& out, const SanitizedPath& path) {
  return out << Path(path.str());
}

std::string SanitizeSegment(std::string_view const name) {
  std::string s;
  s.reserve(name.size());

  for (std::string_view::size_type i = 0; i < name.size(); ++i) {
    char const c = name[i];
    if (c == '\xC2' && i + 1 < name.size() && IsC1Trailer(name[i + 1])) {
      s += '_';
      ++i;
      continue;
    }

    s += IsIllegalChar(c) ? '_' : c;
  }

  // This also empties "." and "..".
  RemoveTrailingDotsAndSpaces(s);

  if (IsReservedName(s))
    s.insert(0, 1, '_');

  s.resize(Path(s).TruncationPosition(NAME_MAX));
  RemoveTrailingDotsAndSpaces(s);
  return s;
}

SanitizedPath Sanitize(std::string_view const name) {
  std::string normalized(name);
  std::ranges::replace(normalized, '\\', '/');

  std::vector<std::string> segments;
  Path in(normalized);

  // Extract part after part.
  Path::size_type i;
  while ((i = in.find_first_not_of('/')) != Path::npos) {
    in.remove_prefix(i);
    assert(!in.empty());

    i = in.find_first_of('/');
    Path const part = in.substr(0, i);
    assert(!part.empty());
    in.remove_prefix(part.size());

    if (std::string s = SanitizeSegment(part); !s.empty())
      segments.push_back(std::move(s));
  }

  return SanitizedPath(std::move(segments));
}

}  // namespace safe_extract
