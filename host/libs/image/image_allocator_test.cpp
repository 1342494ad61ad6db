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

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"
#include "common/libs/utils/size_utils.h"
#include "host/libs/image/image_allocator.h"

namespace bootdisk {

TEST(ImageAllocatorTest, CreatesZeroFilledFileOfExactSize) {
  TemporaryDir dir;
  const std::string image = std::string(dir.path) + "/disk.img";

  ASSERT_THAT(AllocateImage(image, MiBToBytes(4)), IsOk());

  std::string contents;
  ASSERT_TRUE(android::base::ReadFileToString(image, &contents));
  ASSERT_EQ(contents.size(), MiBToBytes(4));
  EXPECT_EQ(contents.find_first_not_of('\0'), std::string::npos);
}

TEST(ImageAllocatorTest, OverwritesExistingFile) {
  TemporaryDir dir;
  const std::string image = std::string(dir.path) + "/disk.img";
  ASSERT_TRUE(android::base::WriteStringToFile(std::string(3 * kMiB, 'x'),
                                               image));

  ASSERT_THAT(AllocateImage(image, MiBToBytes(1)), IsOk());

  std::string contents;
  ASSERT_TRUE(android::base::ReadFileToString(image, &contents));
  ASSERT_EQ(contents.size(), MiBToBytes(1));
  EXPECT_EQ(contents.find_first_not_of('\0'), std::string::npos);
}

TEST(ImageAllocatorTest, MissingParentDirectoryFails) {
  TemporaryDir dir;
  const std::string image = std::string(dir.path) + "/missing/disk.img";

  EXPECT_THAT(AllocateImage(image, MiBToBytes(1)),
              IsErrorAndMessage(testing::HasSubstr("does not exist")));
  EXPECT_FALSE(FileExists(image));
}

}  // namespace bootdisk
