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

#include <gtest/gtest.h>

#include "common/libs/utils/size_utils.h"

namespace bootdisk {

TEST(SizeUtilsTest, AlignUp) {
  EXPECT_EQ(AlignUp(0, kMiB), 0u);
  EXPECT_EQ(AlignUp(1, kMiB), kMiB);
  EXPECT_EQ(AlignUp(kMiB, kMiB), kMiB);
  EXPECT_EQ(AlignUp(kMiB + 1, kSectorSize), kMiB + kSectorSize);
}

TEST(SizeUtilsTest, AlignDown) {
  EXPECT_EQ(AlignDown(kMiB - 1, kMiB), 0u);
  EXPECT_EQ(AlignDown(3 * kMiB + 7, kMiB), 3 * kMiB);
}

TEST(SizeUtilsTest, IsAligned) {
  EXPECT_TRUE(IsAligned(0, kMiB));
  EXPECT_TRUE(IsAligned(MiBToBytes(64), kMiB));
  EXPECT_FALSE(IsAligned(MiBToBytes(64) + kSectorSize, kMiB));
}

TEST(SizeUtilsTest, MiBToBytes) {
  static_assert(MiBToBytes(1) == 1048576, "");
  EXPECT_EQ(MiBToBytes(64), 67108864u);
}

}  // namespace bootdisk
