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

#include "host/libs/image/build_error.h"

#include <ostream>
#include <sstream>
#include <string>

namespace bootdisk {

std::string ToString(BuildErrorKind kind) {
  switch (kind) {
    case BuildErrorKind::kPrecondition:
      return "PreconditionError";
    case BuildErrorKind::kAllocation:
      return "AllocationError";
    case BuildErrorKind::kPartition:
      return "PartitionError";
    case BuildErrorKind::kBind:
      return "BindError";
    case BuildErrorKind::kFormat:
      return "FormatError";
    case BuildErrorKind::kMount:
      return "MountError";
    case BuildErrorKind::kCopy:
      return "CopyError";
    case BuildErrorKind::kVerification:
      return "VerificationError";
    case BuildErrorKind::kBootloaderInstall:
      return "BootloaderInstallError";
    case BuildErrorKind::kInterrupted:
      return "InterruptedError";
    case BuildErrorKind::kResourceLeak:
      return "ResourceLeakError";
  }
  return "UnknownError";
}

std::ostream& operator<<(std::ostream& out, BuildErrorKind kind) {
  return out << ToString(kind);
}

int ExitCode(BuildErrorKind kind) {
  switch (kind) {
    case BuildErrorKind::kPrecondition:
      return 2;
    case BuildErrorKind::kAllocation:
      return 3;
    case BuildErrorKind::kPartition:
      return 4;
    case BuildErrorKind::kBind:
      return 5;
    case BuildErrorKind::kFormat:
      return 6;
    case BuildErrorKind::kMount:
      return 7;
    case BuildErrorKind::kCopy:
      return 8;
    case BuildErrorKind::kVerification:
      return 9;
    case BuildErrorKind::kBootloaderInstall:
      return 10;
    case BuildErrorKind::kInterrupted:
      return 11;
    case BuildErrorKind::kResourceLeak:
      return 12;
  }
  return 1;
}

std::string BuildError::Message() const {
  std::stringstream message;
  if (!stage.empty()) {
    message << stage << ": ";
  }
  message << kind << ": " << trace.Message();
  return message.str();
}

int BuildError::ExitCode() const {
  return bootdisk::ExitCode(leaks.empty() ? kind
                                          : BuildErrorKind::kResourceLeak);
}

}  // namespace bootdisk
