//
// Copyright 2019 Google LLC
// Copyright 2018 ZetaSQL Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

#include "base/logging.h"

#include <sys/stat.h>

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <string>

#include "absl/base/const_init.h"
#include "absl/base/thread_annotations.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"

namespace privacy_release {
namespace base {
namespace {

ABSL_CONST_INIT std::atomic<int> verbosity{0};

ABSL_CONST_INIT absl::Mutex sink_mutex(absl::kConstInit);
// Set once by InitLogging and never freed.
ABSL_CONST_INIT std::ofstream* log_file ABSL_GUARDED_BY(sink_mutex) = nullptr;

absl::string_view Basename(absl::string_view path) {
  const size_t slash = path.rfind('/');
  return slash == absl::string_view::npos ? path : path.substr(slash + 1);
}

char SeverityLetter(absl::LogSeverity severity) {
  switch (severity) {
    case absl::LogSeverity::kInfo:
      return 'I';
    case absl::LogSeverity::kWarning:
      return 'W';
    case absl::LogSeverity::kError:
      return 'E';
    case absl::LogSeverity::kFatal:
      return 'F';
  }
  return '?';
}

bool IsDirectoryOrCreate(const std::string& path) {
  struct stat info;
  if (stat(path.c_str(), &info) == 0) return S_ISDIR(info.st_mode);
  return errno == ENOENT && mkdir(path.c_str(), 0755) == 0;
}

}  // namespace

int get_vlog_level() { return verbosity.load(std::memory_order_relaxed); }

void set_vlog_level(int level) {
  verbosity.store(level, std::memory_order_relaxed);
}

bool InitLogging(const char* directory, const char* program, int vlog_level) {
  set_vlog_level(vlog_level);
  if (directory == nullptr || program == nullptr || *directory == '\0') {
    return false;
  }
  std::string path(directory);
  if (!IsDirectoryOrCreate(path)) return false;
  if (!absl::EndsWith(path, "/")) path += '/';
  absl::StrAppend(&path, Basename(program), ".log");

  absl::MutexLock lock(&sink_mutex);
  if (log_file != nullptr) return false;
  auto* file = new std::ofstream(path, std::ios::app);
  if (!file->is_open()) {
    delete file;
    return false;
  }
  log_file = file;
  return true;
}

namespace logging_internal {

LogMessage::LogMessage(const char* file, int line, absl::LogSeverity severity)
    : severity_(severity) {
  const std::time_t now = std::time(nullptr);
  std::tm local;
  localtime_r(&now, &local);
  char timestamp[32];
  std::strftime(timestamp, sizeof(timestamp), "%m%d %H:%M:%S", &local);
  message_ << SeverityLetter(severity) << timestamp << ' ' << Basename(file)
           << ':' << line << "] ";
}

LogMessage::~LogMessage() {
  Emit();
  if (severity_ == absl::LogSeverity::kFatal) std::abort();
}

void LogMessage::Emit() {
  const std::string text = message_.str();
  message_.str(std::string());
  bool to_stderr = severity_ >= absl::LogSeverity::kError;
  {
    absl::MutexLock lock(&sink_mutex);
    if (log_file != nullptr) {
      *log_file << text << std::endl;
      if (!*log_file) to_stderr = true;
    } else {
      to_stderr = true;
    }
  }
  if (to_stderr) std::cerr << text << std::endl;
}

FatalLogMessage::~FatalLogMessage() {
  Emit();
  std::abort();
}

}  // namespace logging_internal
}  // namespace base
}  // namespace privacy_release
