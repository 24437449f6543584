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

#ifndef SAFE_EXTRACT_CATALOG_H_
#define SAFE_EXTRACT_CATALOG_H_

#include <memory>
#include <span>
#include <string>

#include "error.h"

namespace safe_extract {

// Metadata of an archive entry, as recorded in the archive. The name is
// untrusted: it can be empty, absolute, or contain "..", backslashes, NUL
// bytes or reserved device names.
struct EntryInfo {
  std::string name;
  bool is_directory = false;
  // Decompressed size in bytes, or -1 if the archive doesn't record it.
  i64 size = -1;
};

// Single-use stream of bytes.
class ByteStream {
 public:
  virtual ~ByteStream() = default;

  // Reads up to `dst.size()` bytes into `dst`. Returns the number of bytes
  // read, or 0 at the end of the stream. Throws Error(ErrorKind::Stream) on a
  // read fault.
  virtual i64 Read(std::span<char> dst) = 0;
};

// Read-only, ordered collection of archive entries. Entries are identified by
// their index in [0, GetEntryCount()).
//
// GetEntry and OpenStream can be called concurrently from several threads.
class Catalog {
 public:
  virtual ~Catalog() = default;

  virtual i64 GetEntryCount() const = 0;

  // Throws Error(ErrorKind::CatalogAccess) if `index` is out of range.
  virtual EntryInfo GetEntry(i64 index) const = 0;

  // Opens the data stream of a non-directory entry. The returned stream must
  // be destroyed before this catalog. Throws Error(ErrorKind::CatalogAccess)
  // if the entry cannot be reached or is a directory.
  virtual std::unique_ptr<ByteStream> OpenStream(i64 index) = 0;
};

}  // namespace safe_extract

#endif  // SAFE_EXTRACT_CATALOG_H_
