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

// safe-extract extracts an archive (e.g. foo.tar, foo.tar.gz, foo.zip, foo.7z)
// into a directory. Entry names are sanitized so that no entry can be written
// outside of that directory
// (https://en.wikipedia.org/wiki/Directory_traversal_attack#Archives).

#include <archive.h>
#include <fuse_opt.h>
#include <langinfo.h>
#include <locale.h>
#include <signal.h>
#include <syslog.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iomanip>
#include <iostream>
#include <locale>
#include <string>
#include <string_view>

#include "archive_catalog.h"
#include "error.h"
#include "extractor.h"
#include "fs.h"
#include "log.h"
#include "path.h"

// ---- Compile-time Configuration

#define SAFE_EXTRACT_NAME "safe-extract"

// Even minor versions (e.g. 1.0 or 1.2) are stable versions.
// Odd minor versions (e.g. 1.1 or 1.3) are development versions.
#define SAFE_EXTRACT_VERSION "1.1"

namespace {

using safe_extract::ArchiveCatalog;
using safe_extract::Catalog;
using safe_extract::EntryInfo;
using safe_extract::Error;
using safe_extract::ExitCode;
using safe_extract::i64;
using safe_extract::LogLevel;
using safe_extract::Path;
using safe_extract::Report;
using safe_extract::SetLogLevel;
using safe_extract::Timer;

// ---- Globals

enum {
  KEY_HELP,
  KEY_VERSION,
  KEY_QUIET,
  KEY_VERBOSE,
  KEY_REDACT,
  KEY_FORCE,
  KEY_FSYNC,
  KEY_LIST,
};

struct Options {
  unsigned int jobs = 0;
};

Options g_options;

fuse_opt const g_fuse_opts[] = {
    FUSE_OPT_KEY("--help", KEY_HELP),
    FUSE_OPT_KEY("-h", KEY_HELP),
    FUSE_OPT_KEY("--version", KEY_VERSION),
    FUSE_OPT_KEY("-V", KEY_VERSION),
    FUSE_OPT_KEY("--quiet", KEY_QUIET),
    FUSE_OPT_KEY("quiet", KEY_QUIET),
    FUSE_OPT_KEY("-q", KEY_QUIET),
    FUSE_OPT_KEY("--verbose", KEY_VERBOSE),
    FUSE_OPT_KEY("verbose", KEY_VERBOSE),
    FUSE_OPT_KEY("-v", KEY_VERBOSE),
    FUSE_OPT_KEY("--redact", KEY_REDACT),
    FUSE_OPT_KEY("redact", KEY_REDACT),
    FUSE_OPT_KEY("force", KEY_FORCE),
    FUSE_OPT_KEY("fsync", KEY_FSYNC),
    FUSE_OPT_KEY("--list", KEY_LIST),
    FUSE_OPT_KEY("-l", KEY_LIST),
    {"jobs=%u", offsetof(Options, jobs)},
    FUSE_OPT_END,
};

// Command line options.
bool g_help = false;
bool g_version = false;
bool g_force = false;
bool g_fsync = false;
bool g_list = false;

// Number of command line arguments seen so far.
int g_arg_count = 0;

// Command line argument naming the archive file.
std::string g_archive_path;

// Directory to extract into.
std::string g_output_dir;

// Set by SIGINT or SIGTERM.
std::atomic<bool> g_stop = false;

// ---- Main

int ProcessArg(void*, const char* const arg, int const key, fuse_args*) {
  constexpr int KEEP = 1;
  constexpr int DISCARD = 0;
  constexpr int ERROR = -1;

  switch (key) {
    case FUSE_OPT_KEY_NONOPT:
      switch (++g_arg_count) {
        case 1:
          g_archive_path = arg;
          return DISCARD;

        case 2:
          g_output_dir = arg;
          return DISCARD;

        default:
          LOG(ERROR) << "Too many arguments";
          return ERROR;
      }

    case FUSE_OPT_KEY_OPT:
      LOG(ERROR) << "Unknown option " << std::quoted(arg);
      return ERROR;

    case KEY_HELP:
      g_help = true;
      return DISCARD;

    case KEY_VERSION:
      g_version = true;
      return DISCARD;

    case KEY_QUIET:
      SetLogLevel(LogLevel::ERROR);
      return DISCARD;

    case KEY_VERBOSE:
      SetLogLevel(LogLevel::DEBUG);
      return DISCARD;

    case KEY_REDACT:
      safe_extract::g_redact = true;
      return DISCARD;

    case KEY_FORCE:
      g_force = true;
      return DISCARD;

    case KEY_FSYNC:
      g_fsync = true;
      return DISCARD;

    case KEY_LIST:
      g_list = true;
      return DISCARD;
  }

  return KEEP;
}

void EnsureUtf8() {
  // libarchive (especially for reading 7z) has locale-dependent behavior.
  // Non-ASCII paths can trigger "Pathname cannot be converted from UTF-16LE to
  // current locale" warnings from archive_read_next_header and
  // archive_entry_pathname_utf8 subsequently returning nullptr.
  //
  // Calling setlocale to enforce a UTF-8 encoding can avoid that. Try various
  // arguments and pick the first one that is supported and produces UTF-8.
  const char* const locales[] = {
      "C.UTF-8",
      "en_US.UTF-8",
      // As a final fallback, an empty string means to use the relevant
      // environment variables (LANG, LC_ALL, etc).
      "",
  };

  std::string_view const want = "UTF-8";
  for (const char* const locale : locales) {
    if (setlocale(LC_ALL, locale) && want == nl_langinfo(CODESET)) {
      return;
    }
  }

  LOG(ERROR) << "Cannot ensure UTF-8 encoding";
  throw ExitCode::GENERIC_FAILURE;
}

void OnSignal(int) {
  g_stop = true;
}

// Lets the entries being extracted finish when interrupted. A second signal
// kills the process.
void InstallSignalHandlers() {
  struct sigaction sa = {};
  sa.sa_handler = OnSignal;
  sa.sa_flags = SA_RESETHAND;
  sigemptyset(&sa.sa_mask);
  for (int const sig : {SIGINT, SIGTERM}) {
    if (sigaction(sig, &sa, nullptr) < 0) {
      PLOG(WARNING) << "Cannot install handler for signal " << sig;
    }
  }
}

// Prints the entries of the catalog and where they would be extracted.
void ListEntries(const Catalog& catalog) {
  i64 const n = catalog.GetEntryCount();
  for (i64 i = 0; i < n; ++i) {
    EntryInfo const e = catalog.GetEntry(i);
    std::cout << std::setw(6) << i << "  "
              << (e.is_directory ? "Directory" : "File     ") << "  "
              << std::setw(12);
    if (e.size >= 0) {
      std::cout << e.size;
    } else {
      std::cout << "?";
    }

    std::cout << "  " << Path(e.name) << " -> "
              << Path(safe_extract::GetTargetPath(".", e.name, e.is_directory,
                                                  i))
              << "\n";
  }

  std::cout << std::flush;
}

// Runs a function in its destructor.
struct Cleanup {
  std::function<void()> fn;

  ~Cleanup() {
    if (fn) {
      fn();
    }
  }
};

class NumPunct : public std::numpunct<char> {
 private:
  char do_thousands_sep() const override { return ','; }
  std::string do_grouping() const override { return "\3"; }
};

void PrintUsage() {
  std::cout << "usage: " SAFE_EXTRACT_NAME
               R"( [options] <archive_file> [output_dir]

general options:
    -o opt,[opt...]        extraction options
    -h   --help            print help
    -V   --version         print version
    -l   --list            list the entries instead of extracting them

)" SAFE_EXTRACT_NAME R"( options:
    -q   -o quiet          do not print progress messages
    -v   -o verbose        print more log messages
    -o redact              redact paths from log messages
    -o force               extract what can be read from a damaged archive
    -o fsync               flush every extracted file to disk
    -o jobs=N              number of entries extracted concurrently
                           (default: number of cores)

The output_dir defaults to the current directory. It is created if needed.
)" << std::flush;
}

}  // namespace

int main(int const argc, char** const argv) try {
  // Ensure that numbers in debug messages have thousands separators.
  // It makes big numbers much easier to read (eg sizes expressed in bytes).
  std::locale::global(std::locale(std::locale::classic(), new NumPunct));
  openlog(SAFE_EXTRACT_NAME, LOG_PERROR, LOG_USER);
  SetLogLevel(LogLevel::INFO);

  EnsureUtf8();

  fuse_args args = FUSE_ARGS_INIT(argc, argv);
  Cleanup const free_args{[&args] { fuse_opt_free_args(&args); }};
  if (fuse_opt_parse(&args, &g_options, g_fuse_opts, &ProcessArg) < 0) {
    LOG(ERROR) << "Cannot parse command line arguments";
    throw ExitCode::GENERIC_FAILURE;
  }

  if (g_help) {
    PrintUsage();
    return EXIT_SUCCESS;
  }

  if (g_version) {
    std::cout << SAFE_EXTRACT_NAME " version: " SAFE_EXTRACT_VERSION "\n";
    std::cout << archive_version_details() << "\n";
    std::cout.flush();
    return EXIT_SUCCESS;
  }

  if (g_archive_path.empty()) {
    PrintUsage();
    return EXIT_FAILURE;
  }

  if (g_output_dir.empty()) {
    g_output_dir = ".";
  }

  Timer timer;
  ArchiveCatalog catalog(g_archive_path, {.force = g_force});
  LOG(DEBUG) << "Loaded " << Path(g_archive_path) << " in " << timer;

  if (g_list) {
    ListEntries(catalog);
    return EXIT_SUCCESS;
  }

  try {
    safe_extract::EnsureDirectory(g_output_dir);
  } catch (const Error& e) {
    LOG(ERROR) << e.what();
    throw ExitCode::CANNOT_CREATE_OUTPUT_DIR;
  }

  if (g_options.jobs > static_cast<unsigned int>(safe_extract::kMaxJobs)) {
    LOG(WARNING) << "Using " << safe_extract::kMaxJobs << " jobs instead of "
                 << g_options.jobs;
  }

  InstallSignalHandlers();

  timer.Reset();
  Report const report = safe_extract::ExtractAll(
      catalog, g_output_dir,
      {.jobs = g_options.jobs,
       .fsync = g_fsync,
       .stop = &g_stop});

  LOG(INFO) << "Extracted " << report.extracted << " of "
            << report.entry_count << " entries from " << Path(g_archive_path)
            << " to " << Path(g_output_dir) << " in " << timer;

  if (report.ok()) {
    return EXIT_SUCCESS;
  }

  if (report.skipped > 0) {
    LOG(WARNING) << "Interrupted: " << report.skipped
                 << " entries were not extracted";
  }

  if (!report.failures.empty()) {
    LOG(ERROR) << "Cannot extract " << report.failures.size() << " entries:";
    for (const safe_extract::EntryFailure& f : report.failures) {
      LOG(ERROR) << f;
    }
  }

  // Data errors only, as opposed to filesystem errors.
  if (report.skipped == 0 &&
      std::ranges::all_of(report.failures,
                          [](const safe_extract::EntryFailure& f) {
                            return f.kind == safe_extract::ErrorKind::Stream;
                          })) {
    throw ExitCode::INVALID_ARCHIVE_CONTENTS;
  }

  throw ExitCode::PARTIAL_EXTRACTION;
} catch (ExitCode const e) {
  LOG(DEBUG) << "Returning " << e;
  return static_cast<int>(e);
} catch (const std::exception& e) {
  LOG(ERROR) << e.what();
  LOG(DEBUG) << "Returning " << ExitCode::GENERIC_FAILURE;
  return static_cast<int>(ExitCode::GENERIC_FAILURE);
}
