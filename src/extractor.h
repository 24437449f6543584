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

#ifndef SAFE_EXTRACT_EXTRACTOR_H_
#define SAFE_EXTRACT_EXTRACTOR_H_

#include <atomic>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "catalog.h"
#include "error.h"

namespace safe_extract {

// Upper bound of the number of worker threads.
constexpr int kMaxJobs = 1024;

struct ExtractOptions {
  // Maximum number of entries extracted concurrently. Zero means
  // GetDefaultJobCount(). At most kMaxJobs.
  unsigned int jobs = 0;

  // Flush every extracted file to the storage device before considering it
  // done.
  bool fsync = false;

  // If not null and set, no new entry is started. Entries being extracted run
  // to completion.
  const std::atomic<bool>* stop = nullptr;
};

// Entry that could not be extracted.
struct EntryFailure {
  i64 index;
  std::string name;
  ErrorKind kind;
  std::string message;
};

std::ostream& operator<<(std::ostream& out, const EntryFailure& f);

// Outcome of an extraction run.
struct Report {
  i64 entry_count = 0;
  // Number of entries successfully extracted.
  i64 extracted = 0;
  // Number of entries not attempted because the run was stopped.
  i64 skipped = 0;
  // Failed entries, in index order.
  std::vector<EntryFailure> failures;

  bool ok() const { return failures.empty() && skipped == 0; }
};

// Number of cores, at least 2 and at most 64.
int GetDefaultJobCount();

// Number of worker threads extracting `entry_count` entries when `requested`
// are asked for. It is at least 1, and at most kMaxJobs and `entry_count`.
int GetJobCount(unsigned int requested, i64 entry_count);

// Gets the path where the entry `index` named `name` is extracted under
// `output_root`. The result is always inside `output_root`.
//
// If the sanitized name is empty (e.g. "", "/", ".." or "../.."), a directory
// entry maps to `output_root` itself and a file entry maps to a placeholder
// name "entry-<index>".
std::string GetTargetPath(std::string_view output_root,
                          std::string_view name,
                          bool is_directory,
                          i64 index);

// Extracts a single entry of `catalog` under `output_root`. Directories and
// missing ancestors are created as needed. An existing file is replaced.
// Throws Error.
void ExtractEntry(Catalog& catalog,
                  i64 index,
                  std::string_view output_root,
                  bool fsync = false);

// Extracts every entry of `catalog` under `output_root`, running up to
// `options.jobs` entries concurrently. A failing entry doesn't stop the
// others. Returns once every started entry is finished.
//
// Entries are not extracted in any guaranteed order. When several entries map
// to the same file, the last one to finish wins.
Report ExtractAll(Catalog& catalog,
                  std::string const& output_root,
                  const ExtractOptions& options = {});

}  // namespace safe_extract

#endif  // SAFE_EXTRACT_EXTRACTOR_H_
