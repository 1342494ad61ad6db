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

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "host/libs/image/block_device.h"
#include "host/libs/image/bootloader_installer.h"
#include "host/libs/image/build_error.h"
#include "host/libs/image/build_report.h"
#include "host/libs/image/cleanup_stack.h"
#include "host/libs/image/formatter.h"
#include "host/libs/image/image_lock.h"
#include "host/libs/image/image_spec.h"
#include "host/libs/image/mounter.h"
#include "host/libs/image/partitioner.h"
#include "host/libs/image/staging_manifest.h"

namespace bootdisk {

enum class BuildState {
  kUnallocated,
  kAllocated,
  kPartitioned,
  kFormatted,
  kStaged,
  kReleased,
  kDone,
  kFailing,
  kFailed,
};

std::string ToString(BuildState state);
std::ostream& operator<<(std::ostream& out, BuildState state);

// The external tools a build drives. `bootloader_installer` is optional.
struct BuildTools {
  std::unique_ptr<Partitioner> partitioner;
  std::unique_ptr<DeviceBinder> binder;
  std::unique_ptr<Formatter> formatter;
  std::unique_ptr<Mounter> mounter;
  std::unique_ptr<BootloaderInstaller> bootloader_installer;
};

struct BuildRequest {
  ImageSpec spec;
  std::string source_dir;
  StagingManifest manifest = StagingManifest::Default();
  // partition_size_bytes is filled in from `spec`.
  FormatOptions format;
  bool lock_image = true;
  // Parent of the temporary mount point.
  std::string temp_dir;
};

// The image is assembled in a working file beside the destination and only
// renamed over it once every stage succeeded.
std::string WorkingImagePath(const std::string& image);

/**
 * Runs one image build from an empty file to a published image.
 *
 *   Unallocated -> Allocated -> Partitioned -> Formatted -> Staged ->
 *   Released -> Done
 *
 * A failure anywhere moves to Failing, which releases everything acquired so
 * far in reverse order (mount, mount point, loop device, working image), and
 * ends in Failed. Releases that fail during Failing are attached to the
 * returned error rather than hiding it.
 */
class DiskBuilder {
 public:
  explicit DiskBuilder(BuildTools tools);

  BuildResult<BuildReport> Build(const BuildRequest& request);

  BuildState state() const { return state_; }
  // Every state the last build went through, in order.
  const std::vector<BuildState>& history() const { return history_; }

 private:
  BuildResult<BuildReport> RunStages(const BuildRequest& request,
                                     std::optional<ImageLock>& lock,
                                     CleanupStack& cleanup);
  BuildResult<void> Preflight(const BuildRequest& request);
  void TransitionTo(BuildState next);
  void EnterStage(const std::string& stage);

  BuildTools tools_;
  BuildState state_ = BuildState::kUnallocated;
  std::vector<BuildState> history_;
  std::string stage_;
};

}  // namespace bootdisk
