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

#include <string>
#include <utility>
#include <vector>

#include <android-base/file.h>
#include <gmock/gmock.h>

#include "common/libs/utils/result.h"
#include "host/libs/image/block_device.h"
#include "host/libs/image/bootloader_installer.h"
#include "host/libs/image/formatter.h"
#include "host/libs/image/mounter.h"
#include "host/libs/image/partitioner.h"

namespace bootdisk {

class MockPartitioner : public Partitioner {
 public:
  MockPartitioner();
  MOCK_METHOD(std::string, Name, (), (const, override));
  MOCK_METHOD(Result<void>, CheckAvailable, (), (const, override));
  MOCK_METHOD(Result<void>, Partition,
              (const std::string&, const ImageSpec&), (override));
};

class MockDeviceBinder : public DeviceBinder {
 public:
  MockDeviceBinder();
  MOCK_METHOD(std::string, Name, (), (const, override));
  MOCK_METHOD(Result<void>, CheckAvailable, (), (const, override));
  MOCK_METHOD(Result<BlockDeviceHandle>, Bind, (const std::string&),
              (override));
  MOCK_METHOD(Result<void>, Detach, (BlockDeviceHandle), (override));
};

class MockFormatter : public Formatter {
 public:
  MockFormatter();
  MOCK_METHOD(std::string, Name, (), (const, override));
  MOCK_METHOD(Result<void>, CheckAvailable, (), (const, override));
  MOCK_METHOD(Result<void>, Format,
              (const BlockDeviceHandle&, const FormatOptions&), (override));
};

class MockBootloaderInstaller : public BootloaderInstaller {
 public:
  MockBootloaderInstaller();
  MOCK_METHOD(std::string, Name, (), (const, override));
  MOCK_METHOD(Result<void>, CheckAvailable, (), (const, override));
  MOCK_METHOD(Result<void>, Install, (const std::string&), (override));
};

/**
 * Stands in for a mounted FAT filesystem without needing root.
 *
 * The "device" is a directory. Mounting leaves the mount point as it is so
 * files are copied into it; unmounting moves everything from the mount point
 * into the device directory, leaving the mount point empty the way a real
 * unmount does.
 */
class DirectoryBackedMounter : public Mounter {
 public:
  Result<MountHandle> Mount(const std::string& device,
                            const std::string& mount_point) override;
  Result<void> Flush(const MountHandle& handle) override;
  Result<void> Unmount(MountHandle handle) override;

  void FailMount(bool fail) { fail_mount_ = fail; }
  // The entry at `relative` under the mount point does not survive a flush.
  void LoseOnFlush(std::string relative) { lost_entry_ = std::move(relative); }
  void FailUnmount(bool fail) { fail_unmount_ = fail; }

  int mounted() const { return mounted_; }
  const std::vector<std::string>& mount_points() const {
    return mount_points_;
  }

 private:
  bool fail_mount_ = false;
  bool fail_unmount_ = false;
  std::string lost_entry_;
  int mounted_ = 0;
  std::vector<std::string> mount_points_;
};

// Writes `contents` to `root/relative`, creating parent directories.
void CreateFileForTest(const std::string& root, const std::string& relative,
                       const std::string& contents = "");

// The Limine layout the builds expect: boot/limine/limine.cfg and
// kernel.bin.
void CreateBootTreeForTest(const std::string& root);

}  // namespace bootdisk
