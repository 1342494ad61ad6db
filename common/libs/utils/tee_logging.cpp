/*
 * Copyright (C) 2026 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "common/libs/utils/tee_logging.h"

#include <inttypes.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>

#include <string>
#include <utility>
#include <vector>

#include <android-base/macros.h>
#include <android-base/stringprintf.h>
#include <android-base/strings.h>
#include <android-base/threads.h>

#include "common/libs/fs/shared_buf.h"
#include "common/libs/utils/environment.h"

using android::base::GetThreadId;
using android::base::FATAL;
using android::base::LogSeverity;
using android::base::StringPrintf;

namespace bootdisk {

Result<LogSeverity> ParseSeverity(const std::string& name) {
  using android::base::DEBUG;
  using android::base::EqualsIgnoreCase;
  using android::base::ERROR;
  using android::base::FATAL_WITHOUT_ABORT;
  using android::base::INFO;
  using android::base::VERBOSE;
  using android::base::WARNING;
  for (LogSeverity severity :
       {VERBOSE, DEBUG, INFO, WARNING, ERROR, FATAL_WITHOUT_ABORT, FATAL}) {
    static const char* const kNames[] = {
        "VERBOSE", "DEBUG", "INFO", "WARNING",
        "ERROR",   "FATAL_WITHOUT_ABORT", "FATAL"};
    if (EqualsIgnoreCase(name, kNames[severity]) ||
        name == std::to_string(static_cast<int>(severity))) {
      return severity;
    }
  }
  return BD_ERRF("Unknown log severity \"{}\"", name);
}

static LogSeverity GuessSeverity(const std::string& env_var,
                                 LogSeverity default_value) {
  auto env_value = StringFromEnv(env_var, "");
  if (env_value.empty()) {
    return default_value;
  }
  auto severity = ParseSeverity(env_value);
  return severity.ok() ? *severity : default_value;
}

LogSeverity ConsoleSeverity() {
  return GuessSeverity("BOOTDISK_CONSOLE_SEVERITY", android::base::INFO);
}

LogSeverity LogFileSeverity() {
  return GuessSeverity("BOOTDISK_FILE_SEVERITY", android::base::VERBOSE);
}

TeeLogger::TeeLogger(const std::vector<SeverityTarget>& destinations)
    : destinations_(destinations) {}

// Prefixes every line of `message` with the usual logcat style header.
static std::string StderrOutputGenerator(const struct tm& now, int pid,
                                         uint64_t tid, LogSeverity severity,
                                         const char* tag, const char* file,
                                         unsigned int line,
                                         const char* message) {
  char timestamp[32];
  strftime(timestamp, sizeof(timestamp), "%m-%d %H:%M:%S", &now);

  static const char log_characters[] = "VDIWEFF";
  static_assert(arraysize(log_characters) - 1 == FATAL + 1,
                "Mismatch in size of log_characters and values in LogSeverity");
  char severity_char = log_characters[severity];
  std::string line_prefix;
  if (file != nullptr) {
    line_prefix = StringPrintf("%s %c %s %5d %5" PRIu64 " %s:%u] ",
                               tag ? tag : "nullptr", severity_char, timestamp,
                               pid, tid, file, line);
  } else {
    line_prefix = StringPrintf("%s %c %s %5d %5" PRIu64 " ",
                               tag ? tag : "nullptr", severity_char, timestamp,
                               pid, tid);
  }

  std::string output_string;
  for (const auto& message_line : android::base::Split(message, "\n")) {
    output_string += line_prefix;
    output_string += message_line;
    output_string += "\n";
  }
  return output_string;
}

void TeeLogger::operator()(android::base::LogId, LogSeverity severity,
                           const char* tag, const char* file,
                           unsigned int line, const char* message) {
  struct tm now;
  time_t t = time(nullptr);
  localtime_r(&t, &now);
  auto output_string = StderrOutputGenerator(now, getpid(), GetThreadId(),
                                             severity, tag, file, line,
                                             message);
  for (const auto& destination : destinations_) {
    if (severity >= destination.severity) {
      WriteAll(destination.target, output_string);
    }
  }
}

Result<TeeLogger> LogToStderrAndFiles(
    const std::vector<std::string>& files,
    std::optional<LogSeverity> console_severity) {
  std::vector<SeverityTarget> log_severities;
  for (const auto& file : files) {
    auto log_file_fd = SharedFD::Open(file, O_CREAT | O_WRONLY | O_APPEND,
                                      S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP);
    BD_EXPECTF(log_file_fd->IsOpen(), "Failed to create log file \"{}\": {}",
               file, log_file_fd->StrError());
    log_severities.push_back(SeverityTarget{LogFileSeverity(), log_file_fd});
  }
  log_severities.push_back(
      SeverityTarget{console_severity.value_or(ConsoleSeverity()),
                     SharedFD::Dup(/* stderr */ 2)});
  return TeeLogger(log_severities);
}

}  // namespace bootdisk
