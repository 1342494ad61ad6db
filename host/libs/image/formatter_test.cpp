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

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/result_matchers.h"
#include "common/libs/utils/size_utils.h"
#include "host/libs/image/formatter.h"
#include "host/libs/image/image_spec.h"

namespace bootdisk {

using testing::HasSubstr;

TEST(FormatterTest, SmallVolumesUseSingleSectorClusters) {
  EXPECT_EQ(SectorsPerClusterForCapacity(MiBToBytes(63)), 1);
  EXPECT_EQ(SectorsPerClusterForCapacity(MiBToBytes(260)), 1);
}

TEST(FormatterTest, ClusterSizeGrowsWithCapacity) {
  EXPECT_EQ(SectorsPerClusterForCapacity(MiBToBytes(261)), 8);
  EXPECT_EQ(SectorsPerClusterForCapacity(MiBToBytes(8 * 1024)), 8);
  EXPECT_EQ(SectorsPerClusterForCapacity(MiBToBytes(8 * 1024 + 1)), 16);
  EXPECT_EQ(SectorsPerClusterForCapacity(MiBToBytes(32 * 1024)), 32);
  EXPECT_EQ(SectorsPerClusterForCapacity(MiBToBytes(64 * 1024)), 64);
}

TEST(FormatterTest, AcceptsDosLabels) {
  EXPECT_THAT(ValidateVolumeLabel("BOOTDISK"), IsOk());
  EXPECT_THAT(ValidateVolumeLabel("LIMINE BOOT"), IsOk());
  EXPECT_THAT(ValidateVolumeLabel("OS_2026-01"), IsOk());
}

TEST(FormatterTest, RejectsLabelsFatCannotStore) {
  EXPECT_THAT(ValidateVolumeLabel(""), IsError());
  EXPECT_THAT(ValidateVolumeLabel("TWELVE_CHARS"),
              IsErrorAndMessage(HasSubstr("longer than 11")));
  EXPECT_THAT(ValidateVolumeLabel("bootdisk"),
              IsErrorAndMessage(HasSubstr("upper case")));
  EXPECT_THAT(ValidateVolumeLabel("BOOT.DISK"),
              IsErrorAndMessage(HasSubstr("contains '.'")));
  EXPECT_THAT(ValidateVolumeLabel("BOOT\tDISK"),
              IsErrorAndMessage(HasSubstr("printable")));
}

TEST(FormatterTest, RefusesPartitionBelowFat32Minimum) {
  MkfsFatFormatter formatter;
  BlockDeviceHandle device("/dev/loop0", "/dev/loop0p1", "disk.img");
  FormatOptions options;
  options.partition_size_bytes = kMinFat32Bytes - kSectorSize;

  EXPECT_THAT(formatter.Format(device, options),
              IsErrorAndMessage(HasSubstr("too small for FAT32")));
}

TEST(FormatterTest, RefusesInvalidLabelBeforeRunningMkfs) {
  MkfsFatFormatter formatter;
  BlockDeviceHandle device("/dev/loop0", "/dev/loop0p1", "disk.img");
  FormatOptions options;
  options.partition_size_bytes = MiBToBytes(63);
  options.volume_label = "boot";

  EXPECT_THAT(formatter.Format(device, options), IsError());
}

}  // namespace bootdisk
