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

#ifndef SAFE_EXTRACT_TESTS_TEST_UTIL_H_
#define SAFE_EXTRACT_TESTS_TEST_UTIL_H_

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "catalog.h"
#include "error.h"

namespace safe_extract {
namespace test {

// Temporary directory, deleted with its contents when destroyed.
class ScratchDir {
 public:
  ScratchDir();
  ~ScratchDir();

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::string& path() const { return path_; }

  // Path of `name` inside this directory.
  std::string Sub(std::string_view name) const;

 private:
  std::string path_;
};

// Returns the contents of a file. Fails the current test if it cannot be read.
std::string ReadFile(std::string const& path);

// Writes a file, creating or truncating it.
void WriteFile(std::string const& path, std::string_view contents);

// Maps the relative path of every node under `root` to the contents of the
// file, or to "<dir>" for a directory and "<symlink>" for a symlink.
std::map<std::string, std::string> ListTree(std::string const& root);

// Entry of a FakeCatalog.
struct FakeEntry {
  std::string name;
  bool is_directory = false;
  std::string data;
  // If not negative, the stream throws Error(ErrorKind::Stream) after
  // delivering that many bytes.
  i64 fail_after = -1;
  // If not negative, the stream silently ends after that many bytes although
  // the entry claims to hold all of `data`.
  i64 end_after = -1;
  // OpenStream throws Error(ErrorKind::CatalogAccess).
  bool fail_open = false;
  // Maximum number of bytes returned by a single Read.
  i64 chunk_size = 7;
  // Pause before each Read, in microseconds.
  int read_delay_us = 0;
};

// In-memory catalog. Streams deliver their data in small chunks.
class FakeCatalog : public Catalog {
 public:
  explicit FakeCatalog(std::vector<FakeEntry> entries)
      : entries_(std::move(entries)) {}

  i64 GetEntryCount() const override {
    return static_cast<i64>(entries_.size());
  }

  EntryInfo GetEntry(i64 index) const override;
  std::unique_ptr<ByteStream> OpenStream(i64 index) override;

  // Number of streams opened so far.
  int open_count() const { return open_count_; }

 private:
  const FakeEntry& Get(i64 index) const;

  std::vector<FakeEntry> const entries_;
  std::atomic<int> open_count_ = 0;
};

// Entry to write in a test archive.
struct ArchiveSpec {
  enum class Type { File, Directory, Symlink, Hardlink };

  std::string name;
  Type type = Type::File;
  std::string data;
  // Target of a symlink or hard link.
  std::string link;
};

// Archive formats that WriteArchive can produce.
enum class ArchiveFormat { Zip, TarGz };

// Writes an archive with libarchive. Fails the current test on error.
void WriteArchive(std::string const& path,
                  ArchiveFormat format,
                  const std::vector<ArchiveSpec>& entries);

}  // namespace test
}  // namespace safe_extract

#endif  // SAFE_EXTRACT_TESTS_TEST_UTIL_H_
