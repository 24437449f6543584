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

#ifndef SAFE_EXTRACT_ARCHIVE_CATALOG_H_
#define SAFE_EXTRACT_ARCHIVE_CATALOG_H_

#include <memory>
#include <string>
#include <vector>

#include "catalog.h"
#include "reader.h"

namespace safe_extract {

// Catalog of the directories and regular files of an archive file read with
// libarchive (tar, zip, 7z, rar, cab, iso9660, cpio...).
//
// Hard links are served as regular files with the contents of their target.
// Symlinks and special files (devices, FIFOs, sockets) are skipped.
class ArchiveCatalog : public Catalog {
 public:
  struct Options {
    // Keep the entries found so far if the archive cannot be fully scanned.
    bool force = false;
  };

  // Opens the archive file and scans all its headers. Throws ExitCode.
  ArchiveCatalog(std::string path, Options options);

  ArchiveCatalog(const ArchiveCatalog&) = delete;
  ArchiveCatalog& operator=(const ArchiveCatalog&) = delete;

  i64 GetEntryCount() const override {
    return static_cast<i64>(items_.size());
  }

  EntryInfo GetEntry(i64 index) const override;
  std::unique_ptr<ByteStream> OpenStream(i64 index) override;

 private:
  struct Item {
    // 1-based index of the archive entry holding the data.
    i64 index_within_archive;
    EntryInfo info;
  };

  // Hard link to resolve.
  struct Hardlink {
    i64 index_within_archive;
    std::string source_path;
    std::string target_path;
  };

  void Open();
  void Scan();
  void AddEntry(const Reader& r);
  void ResolveHardlinks();
  const Item& GetItem(i64 index) const;

  ArchiveFile file_;
  Options const options_;
  std::vector<Item> items_;
  std::vector<Hardlink> hardlinks_to_resolve_;
  ReaderPool pool_{file_};
};

}  // namespace safe_extract

#endif  // SAFE_EXTRACT_ARCHIVE_CATALOG_H_
