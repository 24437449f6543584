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

#include "reader.h"

#include <unistd.h>

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <new>

#include "log.h"

namespace safe_extract {

std::string_view GetErrorString(Archive* const a) {
  // Work around bug https://github.com/libarchive/libarchive/issues/2495.
  return archive_error_string(a) ?: "Unspecified error";
}

ArchiveFile::~ArchiveFile() {
  if (fd >= 0 && close(fd) < 0) {
    PLOG(ERROR) << "Cannot close archive file";
  }
}

std::atomic<int> Reader::count = 0;

Reader::Reader(const ArchiveFile& file) : file(file) {
  if (!archive) {
    LOG(ERROR) << "Out of memory";
    throw std::bad_alloc();
  }

  SetFormat();

  // Set callbacks to read the archive file itself.
  Check(archive_read_set_callback_data(archive.get(), this));
  Check(archive_read_set_read_callback(archive.get(), ReadRaw));
  Check(archive_read_set_seek_callback(archive.get(), SeekRaw));
  Check(archive_read_set_skip_callback(archive.get(), SkipRaw));

  // Open the archive.
  Check(archive_read_open1(archive.get()));

  LOG(DEBUG) << "Created " << *this;
}

Reader::~Reader() {
  LOG(DEBUG) << "Deleted " << *this;
}

Entry* Reader::NextEntry() {
  offset_within_entry = 0;
  index_within_archive++;
  while (true) {
    switch (archive_read_next_header(archive.get(), &entry)) {
      case ARCHIVE_RETRY:
        continue;

      case ARCHIVE_WARN:
        LOG(WARNING) << GetErrorString(archive.get());
        [[fallthrough]];

      case ARCHIVE_OK:
        assert(entry);
        return entry;

      case ARCHIVE_EOF:
        entry = nullptr;
        return nullptr;

      case ARCHIVE_FAILED:
      case ARCHIVE_FATAL:
        entry = nullptr;
        failed = true;
        throw Error(ErrorKind::CatalogAccess,
                    StrCat("Cannot advance to entry ", index_within_archive,
                           ": ", GetErrorString(archive.get())));
    }
  }
}

void Reader::AdvanceIndex(i64 const want) {
  if (index_within_archive == want) {
    assert(offset_within_entry == 0);
    return;
  }

  assert(index_within_archive < want);
  Timer const timer;

  do {
    if (!NextEntry()) {
      failed = true;
      throw Error(ErrorKind::CatalogAccess,
                  StrCat("Reached EOF while advancing to entry ", want));
    }
  } while (index_within_archive < want);

  assert(index_within_archive == want);
  LOG(DEBUG) << "Advanced " << *this << " to entry " << want << " in "
             << timer;
}

i64 Reader::Read(std::span<char> const dst) {
  assert(entry);
  while (true) {
    ssize_t const n = archive_read_data(archive.get(), dst.data(), dst.size());
    if (n >= 0) {
      offset_within_entry += n;
      return n;
    }

    if (n == ARCHIVE_RETRY) {
      continue;
    }

    failed = true;
    throw Error(ErrorKind::Stream, StrCat("Cannot read data from archive: ",
                                          GetErrorString(archive.get())));
  }
}

void Reader::Check(int const status) {
  switch (status) {
    case ARCHIVE_OK:
      return;
    case ARCHIVE_WARN:
      LOG(WARNING) << GetErrorString(archive.get());
      return;
    default:
      failed = true;
      throw Error(ErrorKind::CatalogAccess,
                  StrCat("Cannot open archive: ", GetErrorString(archive.get())));
  }
}

void Reader::SetFormat() {
  Archive* const a = archive.get();

  // Activate most of the possible filters and formats, and let libarchive's
  // bidding system do its job.
  Check(archive_read_support_filter_all(a));

  // Prepare the handlers for the recognized archive formats. We first install
  // handlers whose heuristic format identification tests are the fastest and
  // least invasive. If one of them emits a high enough score, then the
  // subsequent testers will do nothing.
  Check(archive_read_support_format_empty(a));
  Check(archive_read_support_format_tar(a));
  Check(archive_read_support_format_ar(a));
  Check(archive_read_support_format_cpio(a));
  Check(archive_read_support_format_lha(a));
  Check(archive_read_support_format_mtree(a));
  Check(archive_read_support_format_xar(a));
  Check(archive_read_support_format_warc(a));

  // More expensive bidders.
  Check(archive_read_support_format_7zip(a));
  Check(archive_read_support_format_cab(a));
  Check(archive_read_support_format_rar(a));
  Check(archive_read_support_format_rar5(a));
  Check(archive_read_support_format_iso9660(a));

  // We don't want to handle ZIP archives in streamable mode.
  // We only handle ZIP archives in seekable mode.
  // See https://github.com/libarchive/libarchive/issues/1764.
  // See https://github.com/libarchive/libarchive/issues/2502.
  Check(archive_read_support_format_zip_seekable(a));
}

ssize_t Reader::ReadRaw(Archive* const a, void* const p, const void** const out) {
  assert(p);
  Reader& r = *static_cast<Reader*>(p);
  assert(r.file.fd >= 0);
  while (true) {
    ssize_t const n =
        pread(r.file.fd, r.raw_bytes, sizeof(r.raw_bytes), r.raw_pos);
    if (n >= 0) {
      r.raw_pos += n;
      r.PrintProgress();
      *out = r.raw_bytes;
      return n;
    }

    if (errno == EINTR) {
      continue;
    }

    archive_set_error(a, errno, "Cannot read archive file: %s",
                      strerror(errno));
    return ARCHIVE_FATAL;
  }
}

i64 Reader::SeekRaw(Archive*, void* const p, i64 const offset, int const whence) {
  assert(p);
  Reader& r = *static_cast<Reader*>(p);
  switch (whence) {
    case SEEK_SET:
      r.raw_pos = offset;
      return r.raw_pos;
    case SEEK_CUR:
      r.raw_pos += offset;
      return r.raw_pos;
    case SEEK_END:
      r.raw_pos = r.file.size + offset;
      return r.raw_pos;
  }
  return ARCHIVE_FATAL;
}

i64 Reader::SkipRaw(Archive*, void* const p, i64 const delta) {
  assert(p);
  Reader& r = *static_cast<Reader*>(p);
  r.raw_pos += delta;
  return delta;
}

void Reader::PrintProgress() {
  if (!should_print_progress) {
    return;
  }

  auto const now = std::chrono::steady_clock::now();
  if (now < next_progress_) {
    return;
  }

  next_progress_ = now + std::chrono::seconds(1);
  assert(file.size > 0);
  LOG(INFO) << ProgressMessage{
      "Loading",
      static_cast<int>(100 * std::min<i64>(raw_pos, file.size) / file.size)};
}

ReaderPool::~ReaderPool() {
  recycled_.clear_and_dispose([](Reader* const r) { delete r; });
}

void ReaderPool::Recycle(Reader* const r) {
  assert(r);
  if (r->failed || !r->entry) {
    delete r;
    return;
  }

  std::lock_guard const lock(mutex_);
  LOG(DEBUG) << "Putting aside " << *r << " currently at offset "
             << r->offset_within_entry << " of entry "
             << r->index_within_archive;
  recycled_.push_front(*r);
  constexpr size_t max_saved_readers = 64;
  if (recycled_.size() > max_saved_readers) {
    Reader& to_delete = recycled_.back();
    recycled_.pop_back();
    delete &to_delete;
  }
}

ReaderPool::Ptr ReaderPool::ReuseOrCreate(i64 const want_index_within_archive) {
  assert(want_index_within_archive > 0);
  Ptr r(nullptr, Recycler{this});

  {
    // Find the closest warm Reader that is before the requested entry.
    std::lock_guard const lock(mutex_);
    Reader* best = nullptr;
    for (Reader& x : recycled_) {
      if (x.IsBefore(want_index_within_archive) &&
          (!best || best->index_within_archive < x.index_within_archive)) {
        best = &x;
      }
    }

    if (best) {
      recycled_.erase(recycled_.iterator_to(*best));
      r.reset(best);
      LOG(DEBUG) << "Reusing " << *r << " currently at offset "
                 << r->offset_within_entry << " of entry "
                 << r->index_within_archive;
    }
  }

  if (!r) {
    r.reset(new Reader(file_));
  }

  assert(r);
  r->AdvanceIndex(want_index_within_archive);
  return r;
}

}  // namespace safe_extract
