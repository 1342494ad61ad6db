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
#pragma once

#include <optional>
#include <string>
#include <vector>

#include <android-base/logging.h>

#include "common/libs/fs/shared_fd.h"
#include "common/libs/utils/result.h"

namespace bootdisk {

// Accepts severity names in any case ("debug", "WARNING") or their numeric
// value.
Result<android::base::LogSeverity> ParseSeverity(const std::string& name);

// Severities taken from BOOTDISK_CONSOLE_SEVERITY and BOOTDISK_FILE_SEVERITY.
android::base::LogSeverity ConsoleSeverity();
android::base::LogSeverity LogFileSeverity();

struct SeverityTarget {
  android::base::LogSeverity severity;
  SharedFD target;
};

// A LogFunction for android::base::InitLogging/SetLogger that duplicates
// every message to several destinations, each with its own threshold.
class TeeLogger {
 private:
  std::vector<SeverityTarget> destinations_;

 public:
  TeeLogger(const std::vector<SeverityTarget>& destinations);
  ~TeeLogger() = default;

  void operator()(android::base::LogId log_id,
                  android::base::LogSeverity severity, const char* tag,
                  const char* file, unsigned int line, const char* message);
};

// `console_severity` overrides ConsoleSeverity() when set.
Result<TeeLogger> LogToStderrAndFiles(
    const std::vector<std::string>& files,
    std::optional<android::base::LogSeverity> console_severity = {});

}  // namespace bootdisk
