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

#ifndef SAFE_EXTRACT_READER_H_
#define SAFE_EXTRACT_READER_H_

#include <archive.h>
#include <archive_entry.h>
#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include <boost/intrusive/list.hpp>

#include "error.h"

namespace safe_extract {

using Archive = struct archive;
using Entry = struct archive_entry;

struct ArchiveDeleter {
  void operator()(Archive* const a) const { archive_read_free(a); }
};

using ArchivePtr = std::unique_ptr<Archive, ArchiveDeleter>;

std::string_view GetErrorString(Archive* a);

// Archive file opened for reading, shared by all the Readers. Readers only
// use pread() on it, so they can read concurrently.
struct ArchiveFile {
  std::string path;
  int fd = -1;
  i64 size = 0;

  ArchiveFile() = default;
  ArchiveFile(const ArchiveFile&) = delete;
  ArchiveFile& operator=(const ArchiveFile&) = delete;

  // Closes fd if it is open.
  ~ArchiveFile();
};

namespace bi = boost::intrusive;

#ifdef NDEBUG
using LinkMode = bi::link_mode<bi::normal_link>;
#else
using LinkMode = bi::link_mode<bi::safe_link>;
#endif

// A Reader bundles libarchive concepts (an archive and an archive entry) and
// other state to point to a particular archive entry (identified by its index)
// in an archive.
//
// A Reader is backed by its own archive_read_open1 call so each can be
// positioned independently. A Reader is used by one thread at a time.
struct Reader : bi::list_base_hook<LinkMode> {
  // Number of Readers created so far.
  static std::atomic<int> count;

  int const id = ++count;
  const ArchiveFile& file;
  ArchivePtr archive = ArchivePtr(archive_read_new());
  Entry* entry = nullptr;
  // 1-based index of the current entry, or 0 before the first entry.
  i64 index_within_archive = 0;
  i64 offset_within_entry = 0;
  // Set when libarchive reported an error. A failed Reader cannot be reused.
  bool failed = false;
  bool should_print_progress = false;
  i64 raw_pos = 0;
  char raw_bytes[16 * 1024];

  // Opens the archive. Throws Error(ErrorKind::CatalogAccess) if libarchive
  // cannot recognize it.
  explicit Reader(const ArchiveFile& file);
  ~Reader();

  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;

  friend std::ostream& operator<<(std::ostream& out, const Reader& r) {
    return out << "Reader #" << r.id;
  }

  // Moves to the next entry. Returns null at the end of the archive. Throws
  // Error(ErrorKind::CatalogAccess) if the next header cannot be read.
  Entry* NextEntry();

  // Walks forward until positioned at the want'th index.
  void AdvanceIndex(i64 want);

  // Can this Reader be advanced to the start of the want'th entry?
  bool IsBefore(i64 const want) const {
    return index_within_archive < want ||
           (index_within_archive == want && offset_within_entry == 0);
  }

  // Copies decompressed bytes of the current entry into `dst`. Returns 0 at
  // the end of the entry. Throws Error(ErrorKind::Stream).
  i64 Read(std::span<char> dst);

 private:
  void Check(int status);

  // Enables the filters and formats recognized by this program, and lets
  // libarchive's bidding system pick the right ones.
  void SetFormat();

  // The following callbacks are used by libarchive to read the raw data from
  // the archive file.
  static ssize_t ReadRaw(Archive* a, void* p, const void** out);
  static i64 SeekRaw(Archive*, void* p, i64 offset, int whence);
  static i64 SkipRaw(Archive*, void* p, i64 delta);

  // Print progress if necessary.
  void PrintProgress();

  std::chrono::steady_clock::time_point next_progress_ =
      std::chrono::steady_clock::now() + std::chrono::seconds(1);
};

// A cache of warm Readers. Libarchive is designed for streaming access, not
// random access, and does not support seeking backwards. Workers that extract
// entries in increasing index order get back a Reader that is already close to
// the entry they want, instead of a new Reader that has to walk from the first
// entry. This keeps the total work linear instead of quadratic.
//
// The warmest Reader is at the front of the list, and the coldest Reader is at
// the back. Thread-safe.
class ReaderPool {
 public:
  explicit ReaderPool(const ArchiveFile& file) : file_(file) {}
  ~ReaderPool();

  ReaderPool(const ReaderPool&) = delete;
  ReaderPool& operator=(const ReaderPool&) = delete;

  // Puts a Reader back into the pool, or deletes it if it failed.
  struct Recycler {
    ReaderPool* pool;
    void operator()(Reader* const r) const { pool->Recycle(r); }
  };

  using Ptr = std::unique_ptr<Reader, Recycler>;

  // Returns a Reader positioned at the start of the given entry. Throws Error.
  Ptr ReuseOrCreate(i64 want_index_within_archive);

 private:
  void Recycle(Reader* r);

  const ArchiveFile& file_;
  std::mutex mutex_;
  bi::list<Reader> recycled_;
};

}  // namespace safe_extract

#endif  // SAFE_EXTRACT_READER_H_
