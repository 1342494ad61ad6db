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

#include <sys/stat.h>
#include <unistd.h>

#include <memory>
#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"
#include "common/libs/utils/size_utils.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/image/block_device.h"
#include "host/libs/image/disk_builder.h"
#include "host/libs/image/formatter.h"
#include "host/libs/image/image_test_helper.h"
#include "host/libs/image/mbr.h"
#include "host/libs/image/mounter.h"
#include "host/libs/image/partitioner.h"

namespace bootdisk {

using testing::IsEmpty;

// Drives losetup, mkfs.fat and mount(2) against a real image. Needs root.
class DiskBuilderHostTest : public testing::Test {
 protected:
  void SetUp() override {
    if (geteuid() != 0) {
      GTEST_SKIP() << "Attaching loop devices requires root";
    }
    for (const auto& tool : {"losetup", "mkfs.fat"}) {
      if (!FindExecutable(tool).ok()) {
        GTEST_SKIP() << tool << " is not installed";
      }
    }
    if (!FileExists("/dev/loop-control")) {
      GTEST_SKIP() << "No loop device support";
    }
    source_ = std::string(source_dir_.path);
    CreateBootTreeForTest(source_);
    request_.spec.path = std::string(output_dir_.path) + "/disk.img";
    request_.source_dir = source_;
    request_.temp_dir = std::string(temp_dir_.path);
  }

  BuildTools HostTools() {
    BuildTools tools;
    tools.partitioner = std::make_unique<MbrPartitioner>(0x1DB00710);
    tools.binder = std::make_unique<LosetupBinder>();
    tools.formatter = std::make_unique<MkfsFatFormatter>();
    tools.mounter = std::make_unique<VfatMounter>();
    return tools;
  }

  TemporaryDir source_dir_;
  TemporaryDir output_dir_;
  TemporaryDir temp_dir_;
  std::string source_;
  BuildRequest request_;
};

TEST_F(DiskBuilderHostTest, BuildsABootableImage) {
  DiskBuilder builder(HostTools());

  auto built = builder.Build(request_);

  ASSERT_TRUE(built.ok()) << built.error().Message();
  EXPECT_EQ(FileSize(request_.spec.path),
            static_cast<off_t>(MiBToBytes(64)));
  EXPECT_THAT(VerifyPartitionTable(request_.spec.path, request_.spec),
              IsOk());
  EXPECT_EQ(built->staging.files, 2u);
  EXPECT_THAT(DirectoryContents(request_.temp_dir), IsOkAndValue(IsEmpty()));

  // Attach the result again and look at what landed on the partition.
  LosetupBinder binder;
  VfatMounter mounter;
  auto device = binder.Bind(request_.spec.path);
  ASSERT_THAT(device, IsOk());
  TemporaryDir mount_point;
  auto mounted = mounter.Mount(device->partition_device(), mount_point.path);
  EXPECT_THAT(mounted, IsOk());
  if (mounted.ok()) {
    std::string kernel;
    EXPECT_TRUE(android::base::ReadFileToString(
        std::string(mount_point.path) + "/kernel.bin", &kernel));
    EXPECT_EQ(kernel.size(), 4096u);
    EXPECT_TRUE(FileExists(std::string(mount_point.path) +
                           "/boot/limine/limine.cfg"));
    EXPECT_THAT(mounter.Unmount(std::move(*mounted)), IsOk());
  }
  EXPECT_THAT(binder.Detach(std::move(*device)), IsOk());
}

TEST_F(DiskBuilderHostTest, FailedStagingReleasesTheLoopDevice) {
  ASSERT_EQ(mkfifo((source_ + "/boot/console").c_str(), 0600), 0);
  DiskBuilder builder(HostTools());

  auto built = builder.Build(request_);

  ASSERT_FALSE(built.ok());
  EXPECT_EQ(built.error().kind, BuildErrorKind::kCopy);
  EXPECT_THAT(built.error().leaks, IsEmpty());
  EXPECT_FALSE(FileExists(request_.spec.path));
  EXPECT_FALSE(FileExists(WorkingImagePath(request_.spec.path)));
  EXPECT_THAT(DirectoryContents(request_.temp_dir), IsOkAndValue(IsEmpty()));
}

}  // namespace bootdisk
