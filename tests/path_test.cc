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

#include "path.h"

#include <gtest/gtest.h>

#include <climits>
#include <filesystem>
#include <iterator>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "error.h"

namespace safe_extract {
namespace {

std::string S(std::string_view const name) {
  return Sanitize(name).str();
}

TEST(SanitizeTest, DropsParentReferences) {
  EXPECT_EQ(S("../../etc/passwd"), "etc/passwd");
  EXPECT_EQ(S("docs/readme/../evil.txt"), "docs/readme/evil.txt");
  EXPECT_EQ(S("a/./b/../c"), "a/b/c");
  EXPECT_EQ(S("....//....//etc"), "etc");
}

TEST(SanitizeTest, DropsRootAndEmptySegments) {
  EXPECT_EQ(S("/etc/passwd"), "etc/passwd");
  EXPECT_EQ(S("//a///b//"), "a/b");
  EXPECT_EQ(S("dir/"), "dir");
}

TEST(SanitizeTest, TreatsBackslashAsSeparator) {
  EXPECT_EQ(Sanitize("a\\b\\c"), Sanitize("a/b/c"));
  EXPECT_EQ(S("..\\..\\evil.txt"), "evil.txt");
  EXPECT_EQ(S("C:\\Windows\\System32"), "C_/Windows/System32");
}

TEST(SanitizeTest, EmptyResults) {
  for (std::string_view const name :
       {"", "/", "\\", "///", ".", "..", "...", "../..", "./.", ". .", " "}) {
    EXPECT_TRUE(Sanitize(name).empty()) << Path(name);
    EXPECT_EQ(S(name), "") << Path(name);
  }
}

TEST(SanitizeTest, ReplacesIllegalCharacters) {
  EXPECT_EQ(S("a<b>c:d\"e|f?g*h"), "a_b_c_d_e_f_g_h");
  EXPECT_EQ(S("x\ty\n"), "x_y_");
  EXPECT_EQ(S(std::string("a\0b", 3)), "a_b");
  EXPECT_EQ(S("\x1f" "z"), "_z");
  EXPECT_EQ(S("del\x7f"), "del\x7f");
}

TEST(SanitizeTest, ReplacesC1ControlCharacters) {
  EXPECT_EQ(S("a\xC2\x85z"), "a_z");
  EXPECT_EQ(S("\xC2\x80\xC2\x9F"), "__");
  // Other two-byte sequences are kept.
  EXPECT_EQ(S("caf\xC3\xA9"), "caf\xC3\xA9");
  EXPECT_EQ(S("a\xC2\xA0" "b"), "a\xC2\xA0" "b");
}

TEST(SanitizeTest, StripsTrailingDotsAndSpaces) {
  EXPECT_EQ(S("file.txt."), "file.txt");
  EXPECT_EQ(S("name . ."), "name");
  EXPECT_EQ(S("dir. /file "), "dir/file");
  EXPECT_EQ(S("...hidden"), "...hidden");
  EXPECT_EQ(S(" lead"), " lead");
}

TEST(SanitizeTest, PrefixesReservedNames) {
  EXPECT_EQ(S("CON"), "_CON");
  EXPECT_EQ(S("con.txt"), "_con.txt");
  EXPECT_EQ(S("Com1.tar.gz"), "_Com1.tar.gz");
  EXPECT_EQ(S("dir/lpt9/nul"), "dir/_lpt9/_nul");
  EXPECT_EQ(S("aux "), "_aux");
  EXPECT_EQ(S("prn."), "_prn");

  EXPECT_EQ(S("console"), "console");
  EXPECT_EQ(S("COM10"), "COM10");
  EXPECT_EQ(S("lpt"), "lpt");
  EXPECT_EQ(S("xcon"), "xcon");
}

TEST(SanitizeTest, TruncatesLongNames) {
  EXPECT_EQ(S(std::string(300, 'a')), std::string(NAME_MAX, 'a'));
  EXPECT_EQ(S("dir/" + std::string(300, 'b')),
            "dir/" + std::string(NAME_MAX, 'b'));

  // Don't split a multi-byte sequence.
  std::string e_acute;
  for (int i = 0; i < 200; ++i) {
    e_acute += "\xC3\xA9";
  }

  std::string const got = S(e_acute);
  EXPECT_EQ(got.size(), size_t{NAME_MAX - 1});
  EXPECT_EQ(got, e_acute.substr(0, NAME_MAX - 1));

  // Truncation can expose a trailing dot.
  EXPECT_EQ(S(std::string(NAME_MAX - 1, 'c') + ". tail"),
            std::string(NAME_MAX - 1, 'c'));
}

TEST(SanitizeTest, SegmentsAreSafe) {
  SanitizedPath const p = Sanitize("../a/./b\\..\\c//d:e/");
  EXPECT_EQ(p.segments(), (std::vector<std::string>{"a", "b", "c", "d_e"}));
}

// Random inputs made of the bytes that matter most.
TEST(SanitizeTest, RandomInputsStayInsideRoot) {
  std::mt19937 rng(42);
  std::string_view const alphabet[] = {
      "/", "\\", ".", "..", " ", "a", "C", "O", "N", ":", "*",
      std::string_view("\0", 1), "\n", "\xC2", "\x85", "\xC3\xA9", "\u200D"};
  std::uniform_int_distribution<size_t> pick(0, std::size(alphabet) - 1);
  std::uniform_int_distribution<int> length(0, 40);

  for (int n = 0; n < 2000; ++n) {
    std::string name;
    for (int i = length(rng); i > 0; --i) {
      name += alphabet[pick(rng)];
    }

    SanitizedPath const p = Sanitize(name);
    for (const std::string& segment : p.segments()) {
      EXPECT_FALSE(segment.empty()) << Path(name);
      EXPECT_NE(segment, ".") << Path(name);
      EXPECT_NE(segment, "..") << Path(name);
      EXPECT_EQ(segment.find_first_of("/\\"), std::string::npos)
          << Path(name);
      EXPECT_LE(segment.size(), size_t{NAME_MAX}) << Path(name);
      for (char const c : segment) {
        EXPECT_GE(static_cast<unsigned char>(c), 0x20) << Path(name);
      }
    }

    std::string const joined = p.JoinUnder("/out");
    std::string const normal =
        std::filesystem::path(joined).lexically_normal().string();
    EXPECT_TRUE(normal == "/out" || normal.starts_with("/out/"))
        << Path(name) << " -> " << Path(joined);

    // Sanitizing is idempotent.
    EXPECT_EQ(Sanitize(p.str()), p) << Path(name);
  }
}

TEST(SanitizedPathTest, JoinUnder) {
  SanitizedPath const p(std::vector<std::string>{"a", "b"});
  EXPECT_EQ(p.str(), "a/b");
  EXPECT_EQ(p.JoinUnder("/out"), "/out/a/b");
  EXPECT_EQ(p.JoinUnder("/out/"), "/out/a/b");
  EXPECT_EQ(p.JoinUnder("out"), "out/a/b");
  EXPECT_EQ(p.JoinUnder(""), "a/b");
  EXPECT_EQ(SanitizedPath().JoinUnder("/out"), "/out");
}

TEST(PathTest, Split) {
  EXPECT_EQ(Path("a/b/c").Split(), std::make_pair(Path("a/b"), Path("c")));
  EXPECT_EQ(Path("c").Split(), std::make_pair(Path(""), Path("c")));
  EXPECT_EQ(Path("/c").Split(), std::make_pair(Path("/"), Path("c")));
}

TEST(PathTest, WithoutTrailingSeparator) {
  EXPECT_EQ(Path("a/b//").WithoutTrailingSeparator(), Path("a/b"));
  EXPECT_EQ(Path("/").WithoutTrailingSeparator(), Path("/"));
  EXPECT_EQ(Path("").WithoutTrailingSeparator(), Path(""));
}

TEST(PathTest, Print) {
  EXPECT_EQ(StrCat(Path("a/b")), "'a/b'");
  EXPECT_EQ(StrCat(Path("it's\n")), "'it\\'s\\x0a'");
  EXPECT_EQ(StrCat(Sanitize("../x")), "'x'");

  g_redact = true;
  EXPECT_EQ(StrCat(Path("secret")), "(redacted)");
  g_redact = false;
}

}  // namespace
}  // namespace safe_extract
