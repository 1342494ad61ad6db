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

#include "host/libs/image/disk_builder.h"

#include <chrono>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include <android-base/file.h>
#include <android-base/logging.h>

#include "common/libs/utils/environment.h"
#include "common/libs/utils/files.h"
#include "host/libs/image/content_stager.h"
#include "host/libs/image/image_allocator.h"
#include "host/libs/image/image_lock.h"
#include "host/libs/image/interrupt.h"
#include "host/libs/image/mbr.h"

namespace bootdisk {
namespace {

#define BD_EXPECT_NOT_INTERRUPTED() \
  BD_EXPECT_KIND(BuildErrorKind::kInterrupted, CheckNotInterrupted(), "")

Result<void> CheckTool(const std::string& role, const std::string& name,
                       Result<void> available) {
  BD_EXPECTF(std::move(available), "The {} \"{}\" cannot run here", role,
             name);
  return {};
}

Result<void> CheckImageDirectory(const std::string& image) {
  auto parent = android::base::Dirname(image);
  BD_EXPECTF(DirectoryExists(parent), "Output directory \"{}\" does not exist",
             parent);
  return {};
}

Result<void> CheckPaths(const BuildRequest& request) {
  BD_EXPECTF(!DirectoryExists(request.spec.path), "\"{}\" is a directory",
             request.spec.path);
  BD_EXPECTF(DirectoryExists(request.source_dir),
             "Build output directory \"{}\" does not exist",
             request.source_dir);
  return {};
}

}  // namespace

std::string ToString(BuildState state) {
  switch (state) {
    case BuildState::kUnallocated:
      return "Unallocated";
    case BuildState::kAllocated:
      return "Allocated";
    case BuildState::kPartitioned:
      return "Partitioned";
    case BuildState::kFormatted:
      return "Formatted";
    case BuildState::kStaged:
      return "Staged";
    case BuildState::kReleased:
      return "Released";
    case BuildState::kDone:
      return "Done";
    case BuildState::kFailing:
      return "Failing";
    case BuildState::kFailed:
      return "Failed";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& out, BuildState state) {
  return out << ToString(state);
}

std::string WorkingImagePath(const std::string& image) {
  return image + ".tmp";
}

DiskBuilder::DiskBuilder(BuildTools tools) : tools_(std::move(tools)) {
  CHECK(tools_.partitioner && tools_.binder && tools_.formatter &&
        tools_.mounter)
      << "A build needs a partitioner, binder, formatter and mounter";
}

void DiskBuilder::TransitionTo(BuildState next) {
  LOG(INFO) << "Build state: " << state_ << " -> " << next;
  state_ = next;
  history_.push_back(next);
}

void DiskBuilder::EnterStage(const std::string& stage) {
  LOG(DEBUG) << "Stage: " << stage;
  stage_ = stage;
}

BuildResult<BuildReport> DiskBuilder::Build(const BuildRequest& request) {
  state_ = BuildState::kUnallocated;
  history_ = {state_};
  stage_.clear();

  // Declared first so that the lock outlives every release.
  std::optional<ImageLock> lock;
  CleanupStack cleanup;
  auto built = RunStages(request, lock, cleanup);
  if (built.ok()) {
    TransitionTo(BuildState::kDone);
    return built;
  }

  auto& error = built.error();
  if (error.stage.empty()) {
    error.stage = stage_;
  }
  // A ^C also reaches the tools running in our process group, so the stage
  // usually fails on its own before the next interrupt check.
  if (PendingInterrupt() != 0 &&
      error.kind != BuildErrorKind::kResourceLeak) {
    error.kind = BuildErrorKind::kInterrupted;
  }
  LOG(ERROR) << "Build failed: " << error.Message();
  TransitionTo(BuildState::kFailing);
  auto unwound = cleanup.Unwind();
  if (!unwound.ok()) {
    error.leaks.push_back(std::move(unwound.error()));
  }
  TransitionTo(BuildState::kFailed);
  return built;
}

BuildResult<void> DiskBuilder::Preflight(const BuildRequest& request) {
  const auto& spec = request.spec;
  BD_EXPECT_KIND(BuildErrorKind::kPrecondition, ValidateImageSpec(spec),
                 "Invalid image geometry");
  BD_EXPECT_KIND(BuildErrorKind::kPrecondition, CheckPaths(request), "");
  BD_EXPECT_KIND(BuildErrorKind::kPrecondition,
                 request.manifest.Check(request.source_dir),
                 "The build output is incomplete");
  BD_EXPECT_KIND(BuildErrorKind::kPrecondition,
                 ValidateVolumeLabel(request.format.volume_label), "");

  BD_EXPECT_KIND(BuildErrorKind::kPrecondition,
                 CheckTool("partitioner", tools_.partitioner->Name(),
                           tools_.partitioner->CheckAvailable()),
                 "");
  BD_EXPECT_KIND(BuildErrorKind::kPrecondition,
                 CheckTool("binder", tools_.binder->Name(),
                           tools_.binder->CheckAvailable()),
                 "");
  BD_EXPECT_KIND(BuildErrorKind::kPrecondition,
                 CheckTool("formatter", tools_.formatter->Name(),
                           tools_.formatter->CheckAvailable()),
                 "");
  BD_EXPECT_KIND(BuildErrorKind::kPrecondition,
                 CheckTool("mounter", "vfat", tools_.mounter->CheckAvailable()),
                 "");
  if (tools_.bootloader_installer) {
    BD_EXPECT_KIND(BuildErrorKind::kPrecondition,
                   CheckTool("bootloader installer",
                             tools_.bootloader_installer->Name(),
                             tools_.bootloader_installer->CheckAvailable()),
                   "");
  }
  return {};
}

BuildResult<BuildReport> DiskBuilder::RunStages(
    const BuildRequest& request, std::optional<ImageLock>& lock,
    CleanupStack& cleanup) {
  const auto start = std::chrono::steady_clock::now();
  const auto& spec = request.spec;
  const auto working_image = WorkingImagePath(spec.path);
  LOG(INFO) << "Building " << spec << " from " << request.source_dir;

  EnterStage("lock");
  BD_EXPECT_KIND(BuildErrorKind::kAllocation, CheckImageDirectory(spec.path),
                 "");
  if (request.lock_image) {
    lock = BD_EXPECT_KIND(BuildErrorKind::kPrecondition,
                          ImageLock::Acquire(spec.path), "");
  }

  EnterStage("preflight");
  BD_EXPECT_NOT_INTERRUPTED();
  auto checked = Preflight(request);
  if (!checked.ok()) {
    return android::base::unexpected(std::move(checked.error()));
  }

  EnterStage("allocate");
  cleanup.Push("working image " + working_image,
               [working_image]() -> Result<void> {
                 if (FileExists(working_image, false)) {
                   BD_EXPECTF(RemoveFile(working_image),
                              "Failed to remove \"{}\"", working_image);
                 }
                 return {};
               });
  BD_EXPECT_KIND(BuildErrorKind::kAllocation,
                 AllocateImage(working_image, spec.total_size_bytes),
                 "Failed to allocate the image");
  TransitionTo(BuildState::kAllocated);
  BD_EXPECT_NOT_INTERRUPTED();

  EnterStage("partition");
  BD_EXPECT_KIND(BuildErrorKind::kPartition,
                 tools_.partitioner->Partition(working_image, spec),
                 tools_.partitioner->Name() << " failed");
  BD_EXPECT_KIND(BuildErrorKind::kPartition,
                 VerifyPartitionTable(working_image, spec),
                 "Unexpected partition table");
  auto mbr = BD_EXPECT_KIND(BuildErrorKind::kPartition, ReadMbr(working_image),
                            "");
  TransitionTo(BuildState::kPartitioned);
  BD_EXPECT_NOT_INTERRUPTED();

  EnterStage("bind");
  auto bound = BD_EXPECT_KIND(BuildErrorKind::kBind,
                              tools_.binder->Bind(working_image),
                              "Failed to bind " << working_image);
  const std::string device_node = bound.device();
  const std::string partition_node = bound.partition_device();
  const std::string device_release = "device " + device_node;
  auto device =
      std::make_shared<std::optional<BlockDeviceHandle>>(std::move(bound));
  DeviceBinder* binder = tools_.binder.get();
  cleanup.Push(device_release, [binder, device]() -> Result<void> {
    BD_EXPECT(device->has_value(), "Device already released");
    BlockDeviceHandle released = std::move(**device);
    device->reset();
    return binder->Detach(std::move(released));
  });
  BD_EXPECT_NOT_INTERRUPTED();

  EnterStage("format");
  auto format_options = request.format;
  format_options.partition_size_bytes = spec.PartitionSizeBytes();
  BD_EXPECT_KIND(BuildErrorKind::kFormat,
                 tools_.formatter->Format(**device, format_options),
                 "Failed to format " << partition_node);
  TransitionTo(BuildState::kFormatted);
  BD_EXPECT_NOT_INTERRUPTED();

  EnterStage("stage");
  auto temp_dir = request.temp_dir.empty() ? TempDir() : request.temp_dir;
  ContentStager stager(*tools_.mounter, request.manifest, temp_dir);
  auto staged = stager.Stage(**device, request.source_dir);
  if (!staged.ok()) {
    return android::base::unexpected(std::move(staged.error()));
  }
  TransitionTo(BuildState::kStaged);

  EnterStage("release");
  BD_EXPECT_KIND(BuildErrorKind::kResourceLeak, cleanup.Pop(device_release),
                 "The staged image could not be detached");
  TransitionTo(BuildState::kReleased);
  BD_EXPECT_NOT_INTERRUPTED();

  BuildReport report;
  if (tools_.bootloader_installer) {
    EnterStage("install bootloader");
    BD_EXPECT_KIND(BuildErrorKind::kBootloaderInstall,
                   tools_.bootloader_installer->Install(working_image),
                   "Failed to install the bootloader");
    report.bootloader_installer = tools_.bootloader_installer->Name();
    BD_EXPECT_NOT_INTERRUPTED();
  }

  EnterStage("publish");
  BD_EXPECT_KIND(BuildErrorKind::kAllocation,
                 RenameFile(working_image, spec.path),
                 "Failed to publish the image");
  BD_EXPECT_KIND(BuildErrorKind::kAllocation,
                 cleanup.Dismiss("working image " + working_image), "");
  LOG(INFO) << "Wrote " << spec.path;

  report.image = spec.path;
  report.size_bytes = static_cast<uint64_t>(FileSize(spec.path));
  report.partition_first_lba = mbr.partitions[0].first_lba;
  report.partition_sectors = mbr.partitions[0].num_sectors;
  report.partition_type = mbr.partitions[0].partition_type;
  report.bootable = mbr.partitions[0].status == kMbrBootable;
  report.device = device_node;
  report.partitioner = tools_.partitioner->Name();
  report.binder = tools_.binder->Name();
  report.formatter = tools_.formatter->Name();
  report.staging = std::move(*staged);
  report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  return report;
}

}  // namespace bootdisk
