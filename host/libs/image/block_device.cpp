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

#include "host/libs/image/block_device.h"

#include <fcntl.h>
#include <linux/loop.h>
#include <stdint.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cctype>
#include <memory>
#include <string>

#include <android-base/logging.h>
#include <android-base/strings.h>

#include "common/libs/fs/shared_fd.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/subprocess.h"

namespace bootdisk {
namespace {

constexpr char kLoopControl[] = "/dev/loop-control";
constexpr int kLoopSetFdAttempts = 5;

// Partition scanning is asynchronous; the node may show up slightly after
// losetup or the ioctl returns.
Result<void> WaitForPartition(const std::string& partition_device) {
  BD_EXPECTF(WaitForFile(partition_device, kPartitionNodeTimeout),
             "Partition node {} did not appear", partition_device);
  return {};
}

}  // namespace

std::string PartitionDeviceName(const std::string& device, int partition) {
  // Kernel naming: a "p" separates the partition number from device names
  // that end in a digit.
  if (!device.empty() && isdigit(static_cast<unsigned char>(device.back()))) {
    return device + "p" + std::to_string(partition);
  }
  return device + std::to_string(partition);
}

Result<void> LosetupBinder::CheckAvailable() const {
  BD_EXPECT(FindExecutable("losetup"));
  return {};
}

Result<BlockDeviceHandle> LosetupBinder::Bind(const std::string& image) {
  Command losetup("losetup");
  losetup.AddParameter("--find");
  losetup.AddParameter("--show");
  losetup.AddParameter("--partscan");
  losetup.AddParameter(image);
  auto output = BD_EXPECT(RunAndCaptureStdout(std::move(losetup)),
                          "No loop device could be attached to " << image);
  auto device = android::base::Trim(output);
  BD_EXPECTF(android::base::StartsWith(device, "/dev/"),
             "Unexpected losetup output \"{}\"", device);
  LOG(DEBUG) << "Attached " << image << " to " << device;

  BlockDeviceHandle handle(device, PartitionDeviceName(device, 1), image);
  auto waited = WaitForPartition(handle.partition_device());
  if (!waited.ok()) {
    // The device is ours until the handle is returned; give it back here.
    auto detached = Detach(std::move(handle));
    if (!detached.ok()) {
      LOG(ERROR) << "Also failed to detach " << device << ": "
                 << detached.error().Message();
    }
    return android::base::unexpected(std::move(waited.error()));
  }
  return handle;
}

Result<void> LosetupBinder::Detach(BlockDeviceHandle handle) {
  Command losetup("losetup");
  losetup.AddParameter("--detach");
  losetup.AddParameter(handle.device());
  BD_EXPECT(RunAndCaptureStdout(std::move(losetup),
                                SubprocessOptions().InGroup(true)),
            "Failed to detach " << handle.device());
  LOG(DEBUG) << "Detached " << handle.device();
  return {};
}

Result<void> LoopControlBinder::CheckAvailable() const {
  BD_EXPECTF(FileExists(kLoopControl), "{} does not exist", kLoopControl);
  return {};
}

Result<BlockDeviceHandle> LoopControlBinder::Bind(const std::string& image) {
  auto control = SharedFD::Open(kLoopControl, O_RDWR);
  BD_EXPECTF(control->IsOpen(), "Failed to open {}: {}", kLoopControl,
             control->StrError());
  auto backing = SharedFD::Open(image, O_RDWR);
  BD_EXPECTF(backing->IsOpen(), "Failed to open \"{}\": {}", image,
             backing->StrError());
  for (int attempt = 1; attempt <= kLoopSetFdAttempts; attempt++) {
    int number = control->Ioctl(LOOP_CTL_GET_FREE);
    BD_EXPECTF(number >= 0, "No free loop device: {}", control->StrError());
    auto device = "/dev/loop" + std::to_string(number);
    auto loop = SharedFD::Open(device, O_RDWR);
    BD_EXPECTF(loop->IsOpen(), "Failed to open {}: {}", device,
               loop->StrError());

    // LOOP_SET_FD takes the descriptor number itself; a private duplicate
    // keeps the SharedFD the owner of the original.
    int fd_number = backing->Fcntl(F_DUPFD_CLOEXEC, 3);
    BD_EXPECTF(fd_number >= 0, "Failed to duplicate \"{}\": {}", image,
               backing->StrError());
    int set = loop->Ioctl(
        LOOP_SET_FD, reinterpret_cast<void*>(static_cast<intptr_t>(fd_number)));
    int set_errno = loop->GetErrno();
    close(fd_number);
    if (set != 0) {
      BD_EXPECTF(set_errno == EBUSY, "LOOP_SET_FD on {} failed: {}", device,
                 strerror(set_errno));
      LOG(DEBUG) << device << " was taken by another process, retrying";
      continue;
    }

    struct loop_info64 info;
    memset(&info, 0, sizeof(info));
    info.lo_flags = LO_FLAGS_PARTSCAN;
    strncpy(reinterpret_cast<char*>(info.lo_file_name), image.c_str(),
            LO_NAME_SIZE - 1);
    if (loop->Ioctl(LOOP_SET_STATUS64, &info) != 0) {
      auto error = loop->StrError();
      if (loop->Ioctl(LOOP_CLR_FD) != 0) {
        LOG(ERROR) << "Failed to clear " << device << ": " << loop->StrError();
      }
      return BD_ERRF("LOOP_SET_STATUS64 on {} failed: {}", device, error);
    }
    LOG(DEBUG) << "Attached " << image << " to " << device;

    BlockDeviceHandle handle(device, PartitionDeviceName(device, 1), image);
    auto waited = WaitForPartition(handle.partition_device());
    if (!waited.ok()) {
      auto detached = Detach(std::move(handle));
      if (!detached.ok()) {
        LOG(ERROR) << "Also failed to detach " << device << ": "
                   << detached.error().Message();
      }
      return android::base::unexpected(std::move(waited.error()));
    }
    return handle;
  }
  return BD_ERRF("Every free loop device was taken before {} could be "
                 "attached ({} attempts)",
                 image, kLoopSetFdAttempts);
}

Result<void> LoopControlBinder::Detach(BlockDeviceHandle handle) {
  auto loop = SharedFD::Open(handle.device(), O_RDWR);
  BD_EXPECTF(loop->IsOpen(), "Failed to open {}: {}", handle.device(),
             loop->StrError());
  BD_EXPECTF(loop->Ioctl(LOOP_CLR_FD) == 0, "LOOP_CLR_FD on {} failed: {}",
             handle.device(), loop->StrError());
  LOG(DEBUG) << "Detached " << handle.device();
  return {};
}

Result<std::unique_ptr<DeviceBinder>> CreateDeviceBinder(
    const std::string& name) {
  if (name == "losetup") {
    return std::make_unique<LosetupBinder>();
  } else if (name == "loop-control") {
    return std::make_unique<LoopControlBinder>();
  }
  return BD_ERRF("Unknown binder \"{}\", expected losetup or loop-control",
                 name);
}

}  // namespace bootdisk
