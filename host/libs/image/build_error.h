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

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <android-base/expected.h>

#include "common/libs/utils/result.h"

namespace bootdisk {

enum class BuildErrorKind {
  kPrecondition,
  kAllocation,
  kPartition,
  kBind,
  kFormat,
  kMount,
  kCopy,
  kVerification,
  kBootloaderInstall,
  kInterrupted,
  kResourceLeak,
};

std::string ToString(BuildErrorKind kind);
std::ostream& operator<<(std::ostream& out, BuildErrorKind kind);
// Process exit status reported for a build that failed with `kind`.
int ExitCode(BuildErrorKind kind);

// A failed build: the kind of failure, the stage it happened in and the
// underlying cause. When releasing resources after the failure also failed,
// `leaks` describes what was left behind.
struct BuildError {
  BuildError(BuildErrorKind kind, StackTraceError trace)
      : kind(kind), trace(std::move(trace)) {}

  BuildErrorKind kind;
  std::string stage;
  StackTraceError trace;
  std::vector<StackTraceError> leaks;

  // "<stage>: <Kind>: <cause>"
  std::string Message() const;
  // ResourceLeakError's code when teardown leaked, otherwise the kind's.
  int ExitCode() const;
};

template <typename T>
using BuildResult = android::base::expected<T, BuildError>;

inline android::base::unexpected<BuildError> BuildFailure(
    BuildErrorKind kind, StackTraceError trace) {
  return android::base::unexpected(BuildError(kind, std::move(trace)));
}

/**
 * Like BD_EXPECT, but for functions returning a BuildResult: a failing
 * Result is returned as a BuildError of the given kind.
 *
 *     auto handle = BD_EXPECT_KIND(BuildErrorKind::kBind, binder.Bind(image),
 *                                  "Failed to bind " << image);
 */
#define BD_EXPECT_KIND(KIND, RESULT, MSG)                                 \
  ({                                                                      \
    auto&& macro_intermediate_result = RESULT;                            \
    if (!macro_intermediate_result.ok()) {                                \
      auto current_entry = BD_STACK_TRACE_ENTRY(#RESULT);                 \
      current_entry << MSG;                                               \
      auto error = macro_intermediate_result.error();                     \
      error.PushEntry(std::move(current_entry));                          \
      return BuildFailure(KIND, std::move(error));                        \
    };                                                                    \
    OutcomeDereference(std::move(macro_intermediate_result));             \
  })

}  // namespace bootdisk
