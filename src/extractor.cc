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

#include "extractor.h"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include "fs.h"
#include "log.h"
#include "path.h"

namespace safe_extract {
namespace {

// Runs `fn`. Turns an exception that is not an Error into an Error of the
// given kind, so that it is recorded against the current entry.
template <typename F>
auto Guard(ErrorKind const kind, F&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const Error&) {
    throw;
  } catch (const std::exception& e) {
    throw Error(kind, e.what());
  }
}

void Extract(Catalog& catalog,
             i64 const index,
             const EntryInfo& entry,
             std::string_view const output_root,
             bool const fsync) {
  std::string const path =
      GetTargetPath(output_root, entry.name, entry.is_directory, index);

  if (entry.is_directory) {
    // The directory may already have been created if iteration is out of
    // order.
    EnsureDirectory(path);
    LOG(DEBUG) << "Extracted Directory [" << index << "] " << Path(path);
    return;
  }

  // Create parent directories. They may not exist if iteration is out of order
  // or if the archive does not contain directory entries.
  EnsureDirectory(Path(path).Split().first);

  std::unique_ptr<ByteStream> const in = Guard(
      ErrorKind::CatalogAccess, [&] { return catalog.OpenStream(index); });
  OutputFile out(path);
  i64 size;

  try {
    size = Guard(ErrorKind::Stream, [&] { return CopyStream(*in, out); });
  } catch (const Error& e) {
    // Keep what was read before the stream failed.
    if (e.kind() == ErrorKind::Stream) {
      out.Close(fsync);
    }

    throw;
  }

  out.Close(fsync);

  // The partially written file is left as is.
  if (entry.size >= 0 && size < entry.size) {
    throw Error(ErrorKind::Stream,
                StrCat("Data stream ended after ", size, " bytes instead of ",
                       entry.size));
  }

  LOG(DEBUG) << "Extracted File [" << index << "] " << Path(path) << " ("
             << size << " bytes)";
}

// State shared by the worker threads of an extraction run.
class Extraction {
 public:
  Extraction(Catalog& catalog,
             std::string const& output_root,
             const ExtractOptions& options)
      : catalog_(catalog),
        output_root_(output_root),
        options_(options),
        entry_count_(catalog.GetEntryCount()) {}

  i64 entry_count() const { return entry_count_; }

  // Extracts entries until there is none left to start. Runs in each worker
  // thread.
  void Work() {
    try {
      while (!ShouldStop()) {
        i64 const i = next_index_++;
        if (i >= entry_count_) {
          return;
        }

        Run(i);
        PrintProgress(++done_);
      }
    } catch (...) {
      // Not an entry error. Stop all the workers and let ExtractAll rethrow.
      Abort(std::current_exception());
    }
  }

  // Stops all the workers because of an unexpected exception.
  void Abort(std::exception_ptr const e) {
    std::lock_guard const lock(mutex_);
    if (!fatal_) {
      fatal_ = e;
    }
    aborted_ = true;
  }

  // Rethrows the exception that aborted the run, if any.
  Report TakeReport() {
    std::lock_guard const lock(mutex_);
    if (fatal_) {
      std::rethrow_exception(fatal_);
    }

    std::ranges::sort(failures_, {}, &EntryFailure::index);
    Report report;
    report.entry_count = entry_count_;
    report.extracted = extracted_;
    report.skipped = entry_count_ - done_;
    report.failures = std::move(failures_);
    return report;
  }

 private:
  bool ShouldStop() const {
    return aborted_ || (options_.stop && *options_.stop);
  }

  void Run(i64 const i) {
    EntryInfo entry;
    try {
      entry = Guard(ErrorKind::CatalogAccess,
                    [&] { return catalog_.GetEntry(i); });
      Extract(catalog_, i, entry, output_root_, options_.fsync);
      ++extracted_;
    } catch (const Error& e) {
      Fail(i, std::move(entry.name), e.kind(), e.what());
    } catch (const std::exception& e) {
      // Creating the file or its directories.
      Fail(i, std::move(entry.name), ErrorKind::Filesystem, e.what());
    }
  }

  void Fail(i64 const i,
            std::string name,
            ErrorKind const kind,
            std::string message) {
    LOG(ERROR) << "Cannot extract [" << i << "] " << Path(name) << ": "
               << message;
    std::lock_guard const lock(mutex_);
    failures_.push_back({.index = i,
                         .name = std::move(name),
                         .kind = kind,
                         .message = std::move(message)});
  }

  void PrintProgress(i64 const done) {
    if (!LOG_IS_ON(INFO)) {
      return;
    }

    auto const now = std::chrono::steady_clock::now();
    std::lock_guard const lock(mutex_);
    if (now < next_progress_) {
      return;
    }

    next_progress_ = now + std::chrono::seconds(1);
    LOG(INFO) << ProgressMessage{
        "Extracting", static_cast<int>(100 * done / entry_count_)};
  }

  Catalog& catalog_;
  std::string const& output_root_;
  const ExtractOptions& options_;
  i64 const entry_count_;

  // Index of the next entry to extract.
  std::atomic<i64> next_index_ = 0;
  // Number of entries attempted so far.
  std::atomic<i64> done_ = 0;
  // Number of entries successfully extracted so far.
  std::atomic<i64> extracted_ = 0;
  std::atomic<bool> aborted_ = false;

  // Guards the members below.
  std::mutex mutex_;
  std::vector<EntryFailure> failures_;
  std::exception_ptr fatal_;
  std::chrono::steady_clock::time_point next_progress_ =
      std::chrono::steady_clock::now() + std::chrono::seconds(1);
};

}  // namespace

std::ostream& operator<<(std::ostream& out, const EntryFailure& f) {
  return out << "[" << f.index << "] " << Path(f.name) << ": " << f.kind
             << ": " << f.message;
}

int GetDefaultJobCount() {
  int const cores = static_cast<int>(std::thread::hardware_concurrency());
  return std::clamp(cores, 2, 64);
}

int GetJobCount(unsigned int const requested, i64 const entry_count) {
  i64 const jobs = requested > 0 ? std::min<i64>(requested, kMaxJobs)
                                 : GetDefaultJobCount();
  return static_cast<int>(std::max<i64>(std::min(jobs, entry_count), 1));
}

std::string GetTargetPath(std::string_view const output_root,
                          std::string_view const name,
                          bool const is_directory,
                          i64 const index) {
  SanitizedPath path = Sanitize(name);
  if (path.empty() && !is_directory) {
    path = SanitizedPath(std::vector{StrCat("entry-", index)});
  }

  return path.JoinUnder(output_root);
}

void ExtractEntry(Catalog& catalog,
                  i64 const index,
                  std::string_view const output_root,
                  bool const fsync) {
  Extract(catalog, index, catalog.GetEntry(index), output_root, fsync);
}

Report ExtractAll(Catalog& catalog,
                  std::string const& output_root,
                  const ExtractOptions& options) {
  Timer const timer;
  Extraction x(catalog, output_root, options);
  i64 const n = x.entry_count();

  if (n > 0) {
    size_t const jobs = GetJobCount(options.jobs, n);
    LOG(DEBUG) << "Extracting " << n << " entries to " << Path(output_root)
               << " with " << jobs << " workers";

    std::vector<std::thread> workers;
    workers.reserve(jobs);
    try {
      while (workers.size() < jobs) {
        workers.emplace_back(&Extraction::Work, &x);
      }
    } catch (const std::system_error& e) {
      // If sufficient resources are not available, then make do with the
      // workers already created.
      if (e.code() != std::errc::resource_unavailable_try_again) {
        x.Abort(std::current_exception());
      } else {
        LOG(WARNING) << "Cannot create more than " << workers.size()
                     << " worker threads";
      }
    }

    if (workers.empty()) {
      x.Work();
    }

    for (std::thread& worker : workers) {
      worker.join();
    }
  }

  Report report = x.TakeReport();

  if (g_latest_log_is_ephemeral) {
    LOG(INFO) << ProgressMessage{"Extracting", 100};
  }

  LOG(DEBUG) << "Extracted " << report.extracted << " of " << n
             << " entries in " << timer;
  return report;
}

}  // namespace safe_extract
