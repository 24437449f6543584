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

#include "fs.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <tuple>
#include <utility>
#include <vector>

#include "log.h"
#include "path.h"

namespace safe_extract {
namespace {

// File creation mask of the process. umask() cannot be read without being
// set, so it is read once before any worker thread starts.
mode_t const g_umask = [] {
  mode_t const mask = umask(0);
  umask(mask);
  return mask;
}();

}  // namespace

void EnsureDirectory(std::string_view const path) {
  Path const dir = Path(path).WithoutTrailingSeparator();
  if (dir.empty()) {
    return;
  }

  std::string const p(dir);
  if (mkdir(p.c_str(), 0777) == 0) {
    LOG(DEBUG) << "Created directory " << Path(p);
    return;
  }

  int err = errno;
  if (err == ENOENT) {
    // Create the missing ancestors first.
    Path const parent = dir.Split().first;
    if (!parent.empty() && parent.size() < dir.size()) {
      EnsureDirectory(parent);
      if (mkdir(p.c_str(), 0777) == 0) {
        LOG(DEBUG) << "Created directory " << Path(p);
        return;
      }

      err = errno;
    }
  }

  if (err == EEXIST) {
    // Either it was already there, or another thread just created it.
    if (struct stat z; stat(p.c_str(), &z) == 0 && S_ISDIR(z.st_mode)) {
      return;
    }

    throw Error(ErrorKind::Filesystem,
                StrCat("Cannot create directory ", Path(p),
                       ": It exists and is not a directory"));
  }

  throw Error(ErrorKind::Filesystem,
              StrCat("Cannot create directory ", Path(p)), err);
}

OutputFile::OutputFile(std::string path) : path_(std::move(path)) {
  // Same directory as the target, so that the final rename() stays within the
  // same file system. mkostemp() uses O_EXCL, which never follows symlinks.
  Path::Append(&temp_path_, Path(path_).Split().first);
  Path::Append(&temp_path_, ".safe-extract-XXXXXX");

  fd_ = mkostemp(temp_path_.data(), O_CLOEXEC);
  if (fd_ < 0) {
    int const err = errno;
    temp_path_.clear();
    throw Error(ErrorKind::Filesystem,
                StrCat("Cannot create file ", Path(path_)), err);
  }

  // mkostemp() creates the file with mode 0600.
  if (fchmod(fd_, 0666 & ~g_umask) < 0) {
    int const err = errno;
    Discard();
    throw Error(ErrorKind::Filesystem,
                StrCat("Cannot set permissions of ", Path(path_)), err);
  }
}

OutputFile::~OutputFile() {
  Discard();
}

void OutputFile::Discard() {
  if (int const fd = std::exchange(fd_, -1); fd >= 0 && close(fd) < 0) {
    PLOG(ERROR) << "Cannot close file " << Path(temp_path_);
  }

  if (!temp_path_.empty() && unlink(temp_path_.c_str()) < 0) {
    PLOG(ERROR) << "Cannot remove file " << Path(temp_path_);
  }

  temp_path_.clear();
}

void OutputFile::Write(std::string_view s) {
  while (!s.empty()) {
    ssize_t const n = write(fd_, s.data(), s.size());
    if (n < 0) {
      if (int const err = errno; err != EINTR) {
        throw Error(ErrorKind::Filesystem,
                    StrCat("Cannot write to file ", Path(path_)), err);
      }

      continue;
    }

    s.remove_prefix(n);
  }
}

void OutputFile::Close(bool const sync) {
  int const fd = std::exchange(fd_, -1);
  if (fd < 0) {
    return;
  }

  if (sync && fsync(fd) < 0) {
    int const err = errno;
    std::ignore = close(fd);
    Discard();
    throw Error(ErrorKind::Filesystem,
                StrCat("Cannot flush file ", Path(path_)), err);
  }

  if (close(fd) < 0) {
    int const err = errno;
    Discard();
    throw Error(ErrorKind::Filesystem,
                StrCat("Cannot close file ", Path(path_)), err);
  }

  // Atomically replaces whatever is at path_.
  if (rename(temp_path_.c_str(), path_.c_str()) < 0) {
    int const err = errno;
    std::string message =
        StrCat("Cannot move ", Path(temp_path_), " to ", Path(path_));
    Discard();
    throw Error(ErrorKind::Filesystem, std::move(message), err);
  }

  temp_path_.clear();
}

i64 CopyStream(ByteStream& in, OutputFile& out) {
  std::vector<char> buffer(64 * 1024);
  i64 total = 0;
  while (i64 const n = in.Read(buffer)) {
    out.Write(std::string_view(buffer.data(), n));
    total += n;
  }

  return total;
}

}  // namespace safe_extract
