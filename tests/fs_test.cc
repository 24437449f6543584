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

#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <filesystem>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include "test_util.h"

namespace safe_extract {
namespace {

using test::FakeCatalog;
using test::ListTree;
using test::ReadFile;
using test::ScratchDir;
using test::WriteFile;

namespace fs = std::filesystem;

using Tree = std::map<std::string, std::string>;

TEST(EnsureDirectoryTest, CreatesAncestors) {
  ScratchDir const dir;
  std::string const path = dir.Sub("a/b/c");
  EnsureDirectory(path);
  EXPECT_TRUE(fs::is_directory(path));
  EXPECT_TRUE(fs::is_directory(dir.Sub("a/b")));
}

TEST(EnsureDirectoryTest, Idempotent) {
  ScratchDir const dir;
  std::string const path = dir.Sub("x/y/");
  EnsureDirectory(path);
  EnsureDirectory(path);
  EnsureDirectory(dir.path());
  EXPECT_TRUE(fs::is_directory(dir.Sub("x/y")));
}

TEST(EnsureDirectoryTest, EmptyPathIsNoOp) {
  EXPECT_NO_THROW(EnsureDirectory(""));
}

TEST(EnsureDirectoryTest, ConcurrentCalls) {
  ScratchDir const dir;
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&dir, i] {
      EXPECT_NO_THROW(EnsureDirectory(
          dir.Sub(StrCat("shared/deep/tree/leaf", i % 4))));
    });
  }

  for (std::thread& t : threads) {
    t.join();
  }

  for (int i = 0; i < 4; ++i) {
    EXPECT_TRUE(fs::is_directory(dir.Sub(StrCat("shared/deep/tree/leaf", i))));
  }
}

TEST(EnsureDirectoryTest, FailsOnFile) {
  ScratchDir const dir;
  WriteFile(dir.Sub("blocker"), "data");

  try {
    EnsureDirectory(dir.Sub("blocker"));
    ADD_FAILURE() << "Expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Filesystem);
  }

  try {
    EnsureDirectory(dir.Sub("blocker/sub/dir"));
    ADD_FAILURE() << "Expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Filesystem);
    EXPECT_EQ(e.err(), ENOTDIR);
  }

  EXPECT_EQ(ReadFile(dir.Sub("blocker")), "data");
}

TEST(OutputFileTest, CreatesAndTruncates) {
  ScratchDir const dir;
  std::string const path = dir.Sub("out.txt");
  WriteFile(path, "some longer previous contents");

  OutputFile out(path);
  out.Write("new");
  out.Write("");
  out.Write(" data");
  out.Close(/* sync = */ true);
  EXPECT_EQ(ReadFile(path), "new data");

  // Closing twice is harmless.
  out.Close();
}

// A symlink at the target path is replaced, and what it points to is kept.
TEST(OutputFileTest, ReplacesSymlinks) {
  ScratchDir const dir;
  WriteFile(dir.Sub("target"), "keep");
  ASSERT_EQ(symlink("target", dir.Sub("link").c_str()), 0);

  OutputFile out(dir.Sub("link"));
  out.Write("replaced");
  out.Close();

  EXPECT_EQ(ListTree(dir.path()),
            (Tree{{"link", "replaced"}, {"target", "keep"}}));
}

TEST(OutputFileTest, NothingChangesUntilClosed) {
  ScratchDir const dir;
  std::string const path = dir.Sub("out.txt");
  WriteFile(path, "previous");

  {
    OutputFile out(path);
    out.Write("unfinished");
    EXPECT_EQ(ReadFile(path), "previous");
  }

  // No temporary file is left behind.
  EXPECT_EQ(ListTree(dir.path()), (Tree{{"out.txt", "previous"}}));
}

TEST(OutputFileTest, LastCloseWins) {
  ScratchDir const dir;
  std::string const path = dir.Sub("out.txt");

  OutputFile first(path);
  OutputFile second(path);
  for (int i = 0; i < 100; ++i) {
    first.Write("AAAAAAAA");
    second.Write("BB");
  }

  second.Close();
  EXPECT_EQ(ReadFile(path), std::string(200, 'B'));
  first.Close();
  EXPECT_EQ(ReadFile(path), std::string(800, 'A'));
  EXPECT_EQ(ListTree(dir.path()).size(), 1u);
}

TEST(OutputFileTest, CannotReplaceDirectory) {
  ScratchDir const dir;
  EnsureDirectory(dir.Sub("sub/inner"));

  OutputFile out(dir.Sub("sub"));
  out.Write("data");
  try {
    out.Close();
    ADD_FAILURE() << "Expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Filesystem);
  }

  EXPECT_EQ(ListTree(dir.path()),
            (Tree{{"sub", "<dir>"}, {"sub/inner", "<dir>"}}));
}

TEST(OutputFileTest, AppliesUmask) {
  ScratchDir const dir;
  std::string const path = dir.Sub("out.txt");
  OutputFile out(path);
  out.Close();

  mode_t const mask = umask(0);
  umask(mask);
  struct stat z;
  ASSERT_EQ(stat(path.c_str(), &z), 0);
  EXPECT_EQ(z.st_mode & 0777, 0666 & ~mask);
}

TEST(OutputFileTest, FailsInMissingDirectory) {
  ScratchDir const dir;
  try {
    OutputFile out(dir.Sub("missing/file"));
    ADD_FAILURE() << "Expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Filesystem);
    EXPECT_EQ(e.err(), ENOENT);
  }
}

TEST(CopyStreamTest, CopiesEverything) {
  ScratchDir const dir;
  std::string data;
  for (int i = 0; i < 1000; ++i) {
    data += StrCat(i, ",");
  }

  FakeCatalog catalog({{.name = "f", .data = data}});
  std::string const path = dir.Sub("f");
  OutputFile out(path);
  EXPECT_EQ(CopyStream(*catalog.OpenStream(0), out),
            static_cast<i64>(data.size()));
  out.Close();
  EXPECT_EQ(ReadFile(path), data);
}

TEST(CopyStreamTest, PropagatesStreamErrors) {
  ScratchDir const dir;
  FakeCatalog catalog({{.name = "f", .data = "0123456789", .fail_after = 4}});
  std::string const path = dir.Sub("f");
  OutputFile out(path);

  try {
    CopyStream(*catalog.OpenStream(0), out);
    ADD_FAILURE() << "Expected an error";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Stream);
  }

  out.Close();
  EXPECT_EQ(ReadFile(path), "0123");
}

}  // namespace
}  // namespace safe_extract
