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

#ifndef SAFE_EXTRACT_FS_H_
#define SAFE_EXTRACT_FS_H_

#include <string>
#include <string_view>

#include "catalog.h"
#include "error.h"

namespace safe_extract {

// Creates the directory `path` and all its missing ancestors. Succeeds if the
// directory already exists, including when another thread creates it
// concurrently. Does nothing if `path` is empty. Throws
// Error(ErrorKind::Filesystem) if `path` or one of its ancestors exists but is
// not a directory, or cannot be created.
void EnsureDirectory(std::string_view path);

// File written under a temporary name in the directory of `path`, and renamed
// to `path` when closed. Whatever was at `path` is replaced, including a
// symlink, which is not followed. When several OutputFiles target the same
// path, the last one to be closed wins and the file never mixes their data.
//
// If the OutputFile is destroyed without being closed, the temporary file is
// removed and `path` is left untouched.
class OutputFile {
 public:
  // Throws Error(ErrorKind::Filesystem).
  explicit OutputFile(std::string path);
  ~OutputFile();

  OutputFile(const OutputFile&) = delete;
  OutputFile& operator=(const OutputFile&) = delete;

  // Writes all of `data`. Throws Error(ErrorKind::Filesystem).
  void Write(std::string_view data);

  // Closes the file, after flushing it to the storage device if `sync` is set,
  // and moves it to its final path. Does nothing if already closed. Throws
  // Error(ErrorKind::Filesystem).
  void Close(bool sync = false);

 private:
  // Removes the temporary file.
  void Discard();

  std::string const path_;
  // Path of the temporary file. Empty once renamed or removed.
  std::string temp_path_;
  int fd_ = -1;
};

// Copies `in` into `out` until the end of `in`. Returns the number of bytes
// copied. Throws Error(ErrorKind::Stream) or Error(ErrorKind::Filesystem).
i64 CopyStream(ByteStream& in, OutputFile& out);

}  // namespace safe_extract

#endif  // SAFE_EXTRACT_FS_H_
