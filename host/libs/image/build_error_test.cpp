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

#include <set>
#include <sstream>
#include <utility>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "host/libs/image/build_error.h"

namespace bootdisk {

namespace {

const BuildErrorKind kAllKinds[] = {
    BuildErrorKind::kPrecondition,      BuildErrorKind::kAllocation,
    BuildErrorKind::kPartition,         BuildErrorKind::kBind,
    BuildErrorKind::kFormat,            BuildErrorKind::kMount,
    BuildErrorKind::kCopy,              BuildErrorKind::kVerification,
    BuildErrorKind::kBootloaderInstall, BuildErrorKind::kInterrupted,
    BuildErrorKind::kResourceLeak,
};

BuildResult<int> FailWithKind(BuildErrorKind kind, Result<int> result) {
  auto value = BD_EXPECT_KIND(kind, std::move(result), "while testing");
  return value + 1;
}

}  // namespace

TEST(BuildErrorTest, EveryKindHasItsOwnExitCode) {
  std::set<int> codes;
  for (auto kind : kAllKinds) {
    int code = ExitCode(kind);
    EXPECT_GT(code, 1) << kind;
    EXPECT_TRUE(codes.insert(code).second) << kind;
  }
  EXPECT_EQ(ExitCode(BuildErrorKind::kPrecondition), 2);
  EXPECT_EQ(ExitCode(BuildErrorKind::kResourceLeak), 12);
}

TEST(BuildErrorTest, KindsPrintByName) {
  std::stringstream out;
  out << BuildErrorKind::kBootloaderInstall;
  EXPECT_EQ(out.str(), "BootloaderInstallError");
  EXPECT_EQ(ToString(BuildErrorKind::kMount), "MountError");
}

TEST(BuildErrorTest, ExpectKindPassesValuesThrough) {
  auto result = FailWithKind(BuildErrorKind::kBind, 41);

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(*result, 42);
}

TEST(BuildErrorTest, ExpectKindWrapsTheCause) {
  auto result =
      FailWithKind(BuildErrorKind::kFormat, BD_ERR("mkfs.fat exited with 1"));

  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, BuildErrorKind::kFormat);
  EXPECT_THAT(result.error().Message(),
              testing::StartsWith("FormatError: "));
  EXPECT_THAT(result.error().Message(),
              testing::HasSubstr("mkfs.fat exited with 1"));
  EXPECT_THAT(result.error().Message(), testing::HasSubstr("while testing"));
}

TEST(BuildErrorTest, MessageNamesTheStage) {
  BuildError error(BuildErrorKind::kCopy, StackTraceError());
  error.stage = "stage";

  EXPECT_THAT(error.Message(), testing::StartsWith("stage: CopyError: "));
  EXPECT_EQ(error.ExitCode(), 8);
}

TEST(BuildErrorTest, LeaksOverrideTheExitCode) {
  BuildError error(BuildErrorKind::kCopy, StackTraceError());
  error.leaks.push_back(StackTraceError());

  EXPECT_EQ(error.kind, BuildErrorKind::kCopy);
  EXPECT_EQ(error.ExitCode(), 12);
}

}  // namespace bootdisk
