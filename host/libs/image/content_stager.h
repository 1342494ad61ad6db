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

#include <cstdint>
#include <string>
#include <vector>

#include "common/libs/utils/result.h"
#include "host/libs/image/block_device.h"
#include "host/libs/image/build_error.h"
#include "host/libs/image/cleanup_stack.h"
#include "host/libs/image/mounter.h"
#include "host/libs/image/staging_manifest.h"

namespace bootdisk {

struct StagingReport {
  // Relative paths in copy order; directories end with '/'.
  std::vector<std::string> entries;
  uint64_t files = 0;
  uint64_t directories = 0;
  uint64_t bytes = 0;
};

// Recursively copies the contents of `source` into the existing directory
// `destination`, following symbolic links and preserving modification times.
// Fails on entries FAT cannot represent and when interrupted.
Result<StagingReport> CopyTree(const std::string& source,
                               const std::string& destination);

// Every entry of `source` exists in `destination` at the same relative path,
// with the same kind and, for files, the same size.
Result<void> VerifyStagedTree(const std::string& source,
                              const std::string& destination);

// Multi-line listing of a staged tree for the logs.
std::string FormatStagedTree(const StagingReport& report);

// Removes an empty mount point, refusing while a filesystem is still
// mounted on it.
Result<void> RemoveMountPoint(const std::string& directory);

// Mounts a formatted partition at a fresh temporary directory, copies the
// build output onto it, verifies the result and leaves nothing mounted.
class ContentStager {
 public:
  ContentStager(Mounter& mounter, StagingManifest manifest,
                std::string temp_parent);

  BuildResult<StagingReport> Stage(const BlockDeviceHandle& device,
                                   const std::string& source_dir);

 private:
  BuildResult<StagingReport> StageWithCleanup(const BlockDeviceHandle& device,
                                              const std::string& source_dir,
                                              CleanupStack& cleanup);

  Mounter& mounter_;
  StagingManifest manifest_;
  std::string temp_parent_;
};

}  // namespace bootdisk
