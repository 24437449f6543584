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

#include "archive_catalog.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <cassert>
#include <unordered_map>
#include <utility>

#include "log.h"
#include "path.h"

namespace safe_extract {
namespace {

enum class FileType : mode_t {
  BlockDevice = S_IFBLK,  // Block-oriented device
  CharDevice = S_IFCHR,   // Character-oriented device
  Directory = S_IFDIR,    // Directory
  Fifo = S_IFIFO,         // FIFO or pipe
  File = S_IFREG,         // Regular file
  Socket = S_IFSOCK,      // Socket
  Symlink = S_IFLNK,      // Symbolic link
};

FileType GetFileType(mode_t const mode) {
  // Consider an unknown file type as a regular file.
  // https://github.com/google/fuse-archive/issues/47
  const mode_t ft = mode & S_IFMT;
  return ft ? FileType(ft) : FileType::File;
}

std::ostream& operator<<(std::ostream& out, FileType const t) {
  switch (t) {
    case FileType::BlockDevice:
      return out << "Block Device";
    case FileType::CharDevice:
      return out << "Character Device";
    case FileType::Directory:
      return out << "Directory";
    case FileType::Fifo:
      return out << "FIFO";
    case FileType::File:
      return out << "File";
    case FileType::Socket:
      return out << "Socket";
    case FileType::Symlink:
      return out << "Symlink";
  }

  return out << "Unknown";
}

// Stream of the decompressed data of an archive entry. Gives its Reader back
// to the pool when destroyed.
class EntryStream : public ByteStream {
 public:
  explicit EntryStream(ReaderPool::Ptr reader) : reader_(std::move(reader)) {
    assert(reader_);
  }

  i64 Read(std::span<char> const dst) override { return reader_->Read(dst); }

 private:
  ReaderPool::Ptr const reader_;
};

}  // namespace

ArchiveCatalog::ArchiveCatalog(std::string path, Options const options)
    : options_(options) {
  file_.path = std::move(path);
  Open();
  Scan();
}

EntryInfo ArchiveCatalog::GetEntry(i64 const index) const {
  return GetItem(index).info;
}

std::unique_ptr<ByteStream> ArchiveCatalog::OpenStream(i64 const index) {
  const Item& item = GetItem(index);
  if (item.info.is_directory) {
    throw Error(ErrorKind::CatalogAccess,
                StrCat("Entry [", index, "] is a directory"));
  }

  return std::make_unique<EntryStream>(
      pool_.ReuseOrCreate(item.index_within_archive));
}

const ArchiveCatalog::Item& ArchiveCatalog::GetItem(i64 const index) const {
  if (index < 0 || index >= GetEntryCount()) {
    throw Error(ErrorKind::CatalogAccess,
                StrCat("No entry [", index, "] in a catalog of ",
                       GetEntryCount(), " entries"));
  }

  return items_[index];
}

void ArchiveCatalog::Open() {
  if (file_.path.empty()) {
    LOG(ERROR) << "Missing archive_filename argument";
    throw ExitCode::GENERIC_FAILURE;
  }

  file_.fd = open(file_.path.c_str(), O_RDONLY | O_CLOEXEC);
  if (file_.fd < 0) {
    PLOG(ERROR) << "Cannot open " << Path(file_.path);
    throw ExitCode::CANNOT_OPEN_ARCHIVE;
  }

  // Check archive file size and type.
  if (struct stat z; fstat(file_.fd, &z) != 0) {
    PLOG(ERROR) << "Cannot stat " << Path(file_.path);
    throw ExitCode::CANNOT_OPEN_ARCHIVE;
  } else if (FileType const ft = GetFileType(z.st_mode); ft != FileType::File) {
    LOG(ERROR) << "Archive " << Path(file_.path)
               << " is not a regular file: It is a " << ft;
    throw ExitCode::CANNOT_OPEN_ARCHIVE;
  } else {
    file_.size = z.st_size;
    LOG(DEBUG) << "Archive file size is " << file_.size << " bytes";
  }
}

// Reads every header of the archive and records the entries to extract.
void ArchiveCatalog::Scan() {
  Timer const timer;
  std::unique_ptr<Reader> r;

  try {
    r = std::make_unique<Reader>(file_);
  } catch (const Error& e) {
    LOG(ERROR) << e.what();
    throw ExitCode::UNKNOWN_ARCHIVE_FORMAT;
  }

  r->should_print_progress = LOG_IS_ON(INFO) && file_.size > 0;
  LOG(DEBUG) << "Archive format is " << archive_format_name(r->archive.get());

  try {
    while (r->NextEntry()) {
      AddEntry(*r);
    }
  } catch (const Error& e) {
    LOG(ERROR) << e.what();
    if (!options_.force || items_.empty()) {
      throw ExitCode::INVALID_ARCHIVE_HEADER;
    }

    LOG(DEBUG) << "Suppressing error " << ExitCode::INVALID_ARCHIVE_HEADER
               << " because of -o force";
  }

  ResolveHardlinks();

  if (g_latest_log_is_ephemeral) {
    LOG(INFO) << ProgressMessage{"Loading", 100};
  }

  LOG(DEBUG) << "Scanned " << Path(file_.path) << " in " << timer << ": "
             << items_.size() << " entries to extract";
}

void ArchiveCatalog::AddEntry(const Reader& r) {
  Entry* const e = r.entry;
  assert(e);
  i64 const i = r.index_within_archive;
  FileType const ft = GetFileType(archive_entry_mode(e));

  const char* const s =
      archive_entry_pathname_utf8(e) ?: archive_entry_pathname(e);
  std::string name = s ? s : "";

  if (const char* const t =
          archive_entry_hardlink_utf8(e) ?: archive_entry_hardlink(e)) {
    // Save it for further resolution.
    hardlinks_to_resolve_.push_back({.index_within_archive = i,
                                     .source_path = std::move(name),
                                     .target_path = t});
    return;
  }

  if (ft != FileType::Directory && ft != FileType::File) {
    LOG(DEBUG) << "Skipped " << ft << " [" << i << "] " << Path(name);
    return;
  }

  items_.push_back(
      {.index_within_archive = i,
       .info = {.name = std::move(name),
                .is_directory = ft == FileType::Directory,
                .size = archive_entry_size_is_set(e) ? archive_entry_size(e)
                                                     : -1}});
}

// A hard link becomes a regular file served with the data of its target. The
// target is looked up by sanitized path, so that "a/b" and "./a//b" match.
void ArchiveCatalog::ResolveHardlinks() {
  if (hardlinks_to_resolve_.empty()) {
    return;
  }

  std::unordered_map<std::string, i64> files_by_path;
  for (i64 i = 0; i < GetEntryCount(); ++i) {
    if (!items_[i].info.is_directory) {
      files_by_path[Sanitize(items_[i].info.name).str()] = i;
    }
  }

  for (Hardlink& link : hardlinks_to_resolve_) {
    auto const it = files_by_path.find(Sanitize(link.target_path).str());
    if (it == files_by_path.end()) {
      LOG(DEBUG) << "Skipped hard link [" << link.index_within_archive << "] "
                 << Path(link.source_path) << ": Cannot find target "
                 << Path(link.target_path);
      continue;
    }

    const Item& target = items_[it->second];
    LOG(DEBUG) << "Resolved hard link [" << link.index_within_archive << "] "
               << Path(link.source_path) << " -> "
               << Path(target.info.name);
    items_.push_back({.index_within_archive = target.index_within_archive,
                      .info = {.name = std::move(link.source_path),
                               .is_directory = false,
                               .size = target.info.size}});
  }

  hardlinks_to_resolve_.clear();
}

}  // namespace safe_extract
