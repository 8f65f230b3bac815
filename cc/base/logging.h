//
// Copyright 2019 Google LLC
// Copyright 2018 ZetaSQL Authors
// Copyright 2018 Asylo authors
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

#ifndef PRIVACY_RELEASE_BASE_LOGGING_H_
#define PRIVACY_RELEASE_BASE_LOGGING_H_

#include <optional>
#include <sstream>
#include <string>

#include "absl/base/attributes.h"
#include "absl/base/log_severity.h"

// Minimal glog-style logging for the library and the example binaries.
//
//   LOG(WARNING) << "Releasing without a budget ceiling";
//   LOG_IF(INFO, scope_id > 0) << "Opened scope " << scope_id;
//   VLOG(1) << "Deepened " << column << " to " << depth;
//
// Messages go to the file chosen by InitLogging, or to stderr before it is
// called. ERROR and FATAL messages are always copied to stderr. FATAL aborts
// once the message is written.
#define LOG(severity) PRIVACY_RELEASE_LOG_##severity.stream()

#define LOG_IF(severity, condition)                                   \
  !(condition) ? (void)0                                              \
               : ::privacy_release::base::logging_internal::Discard() & \
                     LOG(severity)

// Logged at INFO when `level` is at most the configured verbosity.
#define VLOG(level) \
  LOG_IF(INFO, (level) <= ::privacy_release::base::get_vlog_level())

// CHECK guards internal invariants only. Bad arguments are reported with
// absl::Status, never with CHECK.
#define CHECK(condition) \
  LOG_IF(FATAL, !(condition)) << "Check failed: " #condition " "

#define CHECK_EQ(a, b) PRIVACY_RELEASE_CHECK_OP(==, a, b)
#define CHECK_NE(a, b) PRIVACY_RELEASE_CHECK_OP(!=, a, b)
#define CHECK_LE(a, b) PRIVACY_RELEASE_CHECK_OP(<=, a, b)
#define CHECK_LT(a, b) PRIVACY_RELEASE_CHECK_OP(<, a, b)
#define CHECK_GE(a, b) PRIVACY_RELEASE_CHECK_OP(>=, a, b)
#define CHECK_GT(a, b) PRIVACY_RELEASE_CHECK_OP(>, a, b)

#define DCHECK(condition) CHECK(condition)
#define DCHECK_EQ(a, b) CHECK_EQ(a, b)
#define DCHECK_NE(a, b) CHECK_NE(a, b)
#define DCHECK_LE(a, b) CHECK_LE(a, b)
#define DCHECK_LT(a, b) CHECK_LT(a, b)
#define DCHECK_GE(a, b) CHECK_GE(a, b)
#define DCHECK_GT(a, b) CHECK_GT(a, b)

#define PRIVACY_RELEASE_LOG_INFO                               \
  ::privacy_release::base::logging_internal::LogMessage(       \
      __FILE__, __LINE__, absl::LogSeverity::kInfo)
#define PRIVACY_RELEASE_LOG_WARNING                            \
  ::privacy_release::base::logging_internal::LogMessage(       \
      __FILE__, __LINE__, absl::LogSeverity::kWarning)
#define PRIVACY_RELEASE_LOG_ERROR                              \
  ::privacy_release::base::logging_internal::LogMessage(       \
      __FILE__, __LINE__, absl::LogSeverity::kError)
#define PRIVACY_RELEASE_LOG_FATAL                              \
  ::privacy_release::base::logging_internal::FatalLogMessage(  \
      __FILE__, __LINE__)

// Evaluates both operands once and streams "a op b (x vs. y)" on failure.
#define PRIVACY_RELEASE_CHECK_OP(op, a, b)                                  \
  while (std::optional<std::string> privacy_release_check_failure =        \
             ::privacy_release::base::logging_internal::CompareOrDescribe( \
                 (a), (b), [](const auto& x, const auto& y) {              \
                   return x op y;                                          \
                 },                                                        \
                 #a " " #op " " #b))                                       \
  LOG(FATAL) << "Check failed: " << *privacy_release_check_failure << " "

namespace privacy_release {
namespace base {

int get_vlog_level();
void set_vlog_level(int level);

// Appends messages to `<directory>/<basename of program>.log` from now on,
// creating `directory` if needed, and sets the VLOG verbosity. Returns false
// and keeps logging to stderr when the file cannot be used or logging was
// already initialized.
bool InitLogging(const char* directory, const char* program, int vlog_level);

namespace logging_internal {

class LogMessage {
 public:
  LogMessage(const char* file, int line, absl::LogSeverity severity);
  LogMessage(const LogMessage&) = delete;
  LogMessage& operator=(const LogMessage&) = delete;
  ~LogMessage();

  std::ostream& stream() { return message_; }

 protected:
  // Writes the buffered message and empties the buffer.
  void Emit();

 private:
  const absl::LogSeverity severity_;
  std::ostringstream message_;
};

class FatalLogMessage : public LogMessage {
 public:
  FatalLogMessage(const char* file, int line)
      : LogMessage(file, line, absl::LogSeverity::kFatal) {}
  ABSL_ATTRIBUTE_NORETURN ~FatalLogMessage();
};

// Gives LOG_IF's stream expression type void. `&` binds looser than `<<`.
struct Discard {
  void operator&(const std::ostream&) {}
};

template <typename A, typename B, typename Compare>
std::optional<std::string> CompareOrDescribe(const A& a, const B& b,
                                             Compare compare,
                                             const char* expression) {
  if (compare(a, b)) return std::nullopt;
  std::ostringstream description;
  description << expression << " (" << a << " vs. " << b << ")";
  return description.str();
}

}  // namespace logging_internal
}  // namespace base
}  // namespace privacy_release

#endif  // PRIVACY_RELEASE_BASE_LOGGING_H_
