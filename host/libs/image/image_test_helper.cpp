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

#include "host/libs/image/image_test_helper.h"

#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <cerrno>
#include <string>

#include <android-base/file.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"

namespace bootdisk {

using testing::Return;

MockPartitioner::MockPartitioner() {
  ON_CALL(*this, Name()).WillByDefault(Return("mock-partitioner"));
  ON_CALL(*this, CheckAvailable()).WillByDefault(Return(Result<void>{}));
}

MockDeviceBinder::MockDeviceBinder() {
  ON_CALL(*this, Name()).WillByDefault(Return("mock-binder"));
  ON_CALL(*this, CheckAvailable()).WillByDefault(Return(Result<void>{}));
}

MockFormatter::MockFormatter() {
  ON_CALL(*this, Name()).WillByDefault(Return("mock-formatter"));
  ON_CALL(*this, CheckAvailable()).WillByDefault(Return(Result<void>{}));
}

MockBootloaderInstaller::MockBootloaderInstaller() {
  ON_CALL(*this, Name()).WillByDefault(Return("mock-limine"));
  ON_CALL(*this, CheckAvailable()).WillByDefault(Return(Result<void>{}));
}

Result<MountHandle> DirectoryBackedMounter::Mount(
    const std::string& device, const std::string& mount_point) {
  BD_EXPECT(!fail_mount_, "mount failure requested by the test");
  BD_EXPECTF(DirectoryExists(device), "No device directory \"{}\"", device);
  mounted_++;
  mount_points_.push_back(mount_point);
  return MountHandle(device, mount_point);
}

Result<void> DirectoryBackedMounter::Flush(const MountHandle& handle) {
  if (lost_entry_.empty()) {
    return {};
  }
  auto path = handle.mount_point() + "/" + lost_entry_;
  BD_EXPECTF(unlink(path.c_str()) == 0, "Failed to drop \"{}\": {}", path,
             strerror(errno));
  return {};
}

Result<void> DirectoryBackedMounter::Unmount(MountHandle handle) {
  BD_EXPECT(!fail_unmount_, "unmount failure requested by the test");
  auto names = BD_EXPECT(DirectoryContents(handle.mount_point()));
  for (const auto& name : names) {
    auto from = handle.mount_point() + "/" + name;
    auto to = handle.device() + "/" + name;
    BD_EXPECTF(rename(from.c_str(), to.c_str()) == 0,
               "Failed to move \"{}\" to \"{}\": {}", from, to,
               strerror(errno));
  }
  mounted_--;
  return {};
}

void CreateFileForTest(const std::string& root, const std::string& relative,
                       const std::string& contents) {
  auto path = root + "/" + relative;
  ASSERT_TRUE(EnsureDirectoryExists(android::base::Dirname(path)).ok());
  ASSERT_TRUE(android::base::WriteStringToFile(contents, path)) << path;
}

void CreateBootTreeForTest(const std::string& root) {
  CreateFileForTest(root, "boot/limine/limine.cfg",
                    "timeout: 0\n/bootdisk\n    protocol: limine\n"
                    "    kernel_path: boot():/kernel.bin\n");
  CreateFileForTest(root, "kernel.bin", std::string(4096, '\x90'));
}

}  // namespace bootdisk
