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

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>
#include <vector>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"

namespace bootdisk {

TEST(FilesTest, DirectoryContentsIsSortedWithoutDots) {
  TemporaryDir dir;
  const std::string root = dir.path;
  ASSERT_TRUE(android::base::WriteStringToFile("b", root + "/b"));
  ASSERT_TRUE(android::base::WriteStringToFile("a", root + "/a"));
  ASSERT_EQ(mkdir((root + "/c").c_str(), 0755), 0);

  EXPECT_THAT(DirectoryContents(root),
              IsOkAndValue(testing::ElementsAre("a", "b", "c")));
}

TEST(FilesTest, DirectoryContentsOfMissingDirectoryFails) {
  TemporaryDir dir;
  EXPECT_THAT(DirectoryContents(std::string(dir.path) + "/missing"),
              IsError());
}

TEST(FilesTest, EnsureDirectoryExistsCreatesParents) {
  TemporaryDir dir;
  const std::string nested = std::string(dir.path) + "/x/y/z";

  ASSERT_THAT(EnsureDirectoryExists(nested), IsOk());
  EXPECT_TRUE(DirectoryExists(nested));
  EXPECT_THAT(EnsureDirectoryExists(nested), IsOk());
}

TEST(FilesTest, CreateTempDirectoryUsesPrefix) {
  TemporaryDir dir;
  auto created = CreateTempDirectory(dir.path, "bootdisk-mnt-");

  ASSERT_THAT(created, IsOk());
  EXPECT_TRUE(DirectoryExists(*created));
  EXPECT_EQ(android::base::Basename(*created).rfind("bootdisk-mnt-", 0), 0);
  EXPECT_THAT(RemoveEmptyDirectory(*created), IsOk());
  EXPECT_FALSE(DirectoryExists(*created));
}

TEST(FilesTest, RemoveEmptyDirectoryRefusesContents) {
  TemporaryDir dir;
  const std::string sub = std::string(dir.path) + "/sub";
  ASSERT_EQ(mkdir(sub.c_str(), 0755), 0);
  ASSERT_TRUE(android::base::WriteStringToFile("data", sub + "/file"));

  EXPECT_THAT(RemoveEmptyDirectory(sub), IsError());
  EXPECT_TRUE(FileExists(sub + "/file"));
}

TEST(FilesTest, PlainDirectoryIsNotAMountPoint) {
  TemporaryDir dir;
  EXPECT_THAT(IsMountPoint(dir.path), IsOkAndValue(false));
}

TEST(FilesTest, RootIsAMountPoint) {
  EXPECT_THAT(IsMountPoint("/"), IsOkAndValue(true));
}

TEST(FilesTest, CopyReproducesContents) {
  TemporaryDir dir;
  const std::string from = std::string(dir.path) + "/from";
  const std::string to = std::string(dir.path) + "/to";
  std::string contents(200000, 'k');
  ASSERT_TRUE(android::base::WriteStringToFile(contents, from));

  EXPECT_THAT(Copy(from, to), IsOkAndValue(200000));
  std::string copied;
  ASSERT_TRUE(android::base::ReadFileToString(to, &copied));
  EXPECT_EQ(copied, contents);
}

TEST(FilesTest, CopyOfMissingFileFails) {
  TemporaryDir dir;
  EXPECT_THAT(Copy(std::string(dir.path) + "/missing",
                   std::string(dir.path) + "/to"),
              IsError());
}

TEST(FilesTest, RenameFileReplacesTarget) {
  TemporaryDir dir;
  const std::string from = std::string(dir.path) + "/disk.img.tmp";
  const std::string to = std::string(dir.path) + "/disk.img";
  ASSERT_TRUE(android::base::WriteStringToFile("new", from));
  ASSERT_TRUE(android::base::WriteStringToFile("old", to));

  EXPECT_THAT(RenameFile(from, to), IsOkAndValue(to));
  std::string contents;
  ASSERT_TRUE(android::base::ReadFileToString(to, &contents));
  EXPECT_EQ(contents, "new");
  EXPECT_FALSE(FileExists(from));
}

TEST(FilesTest, FileSizeOfMissingFileIsZero) {
  EXPECT_EQ(FileSize("/nonexistent/bootdisk/file"), 0);
}

TEST(FilesTest, WaitForExistingFileReturnsImmediately) {
  TemporaryFile file;
  EXPECT_THAT(WaitForFile(file.path, std::chrono::milliseconds(0)), IsOk());
}

TEST(FilesTest, WaitForMissingFileTimesOut) {
  TemporaryDir dir;
  EXPECT_THAT(WaitForFile(std::string(dir.path) + "/never",
                          std::chrono::milliseconds(100)),
              IsError());
}

TEST(FilesTest, RecursivelyRemoveDirectoryRemovesTree) {
  TemporaryDir dir;
  const std::string tree = std::string(dir.path) + "/tree";
  ASSERT_THAT(EnsureDirectoryExists(tree + "/a/b"), IsOk());
  ASSERT_TRUE(android::base::WriteStringToFile("x", tree + "/a/b/file"));

  EXPECT_TRUE(RecursivelyRemoveDirectory(tree));
  EXPECT_FALSE(FileExists(tree));
}

}  // namespace bootdisk
