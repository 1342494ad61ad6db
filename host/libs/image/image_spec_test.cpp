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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/result_matchers.h"
#include "common/libs/utils/size_utils.h"
#include "host/libs/image/image_spec.h"

namespace bootdisk {

using testing::HasSubstr;

ImageSpec DefaultSpec() {
  ImageSpec spec;
  spec.path = "/tmp/disk.img";
  return spec;
}

TEST(ImageSpecTest, DefaultsAreValid) {
  auto spec = DefaultSpec();

  EXPECT_THAT(ValidateImageSpec(spec), IsOk());
  EXPECT_EQ(spec.total_size_bytes, 64u * kMiB);
  EXPECT_EQ(spec.partition_offset_bytes, kMiB);
  EXPECT_EQ(spec.PartitionFirstLba(), 2048u);
  EXPECT_EQ(spec.PartitionSectors(), 63u * 2048);
}

TEST(ImageSpecTest, RejectsEmptyPath) {
  auto spec = DefaultSpec();
  spec.path.clear();

  EXPECT_THAT(ValidateImageSpec(spec), IsError());
}

TEST(ImageSpecTest, RejectsSizeThatIsNotWholeMiB) {
  auto spec = DefaultSpec();
  spec.total_size_bytes += kSectorSize;

  EXPECT_THAT(ValidateImageSpec(spec),
              IsErrorAndMessage(HasSubstr("whole number of MiB")));
}

TEST(ImageSpecTest, RejectsUnalignedOrZeroOffset) {
  auto spec = DefaultSpec();
  spec.partition_offset_bytes = 63 * kSectorSize;
  EXPECT_THAT(ValidateImageSpec(spec),
              IsErrorAndMessage(HasSubstr("aligned")));

  spec.partition_offset_bytes = 0;
  EXPECT_THAT(ValidateImageSpec(spec), IsError());
}

TEST(ImageSpecTest, RejectsPartitionBelowFat32Minimum) {
  auto spec = DefaultSpec();
  spec.total_size_bytes = MiBToBytes(33);

  EXPECT_THAT(ValidateImageSpec(spec),
              IsErrorAndMessage(HasSubstr("FAT32 minimum")));
}

TEST(ImageSpecTest, SmallestValidImage) {
  auto spec = DefaultSpec();
  // 66600 sectors round up to 33 MiB, plus the 1 MiB offset.
  spec.total_size_bytes = MiBToBytes(34);

  EXPECT_THAT(ValidateImageSpec(spec), IsOk());
}

TEST(ImageSpecTest, RejectsOffsetPastTheEnd) {
  auto spec = DefaultSpec();
  spec.partition_offset_bytes = spec.total_size_bytes;

  EXPECT_THAT(ValidateImageSpec(spec), IsError());
}

TEST(ImageSpecTest, RejectsImagesBeyondMbrAddressing) {
  auto spec = DefaultSpec();
  spec.total_size_bytes = MiBToBytes(4 * 1024 * 1024);

  EXPECT_THAT(ValidateImageSpec(spec), IsErrorAndMessage(HasSubstr("MBR")));
}

TEST(ImageSpecTest, ParseFilesystemType) {
  EXPECT_THAT(ParseFilesystemType("fat32"),
              IsOkAndValue(FilesystemType::kFat32));
  EXPECT_THAT(ParseFilesystemType("FAT32"),
              IsOkAndValue(FilesystemType::kFat32));
  EXPECT_THAT(ParseFilesystemType("ext4"),
              IsErrorAndMessage(HasSubstr("only fat32")));
}

}  // namespace bootdisk
