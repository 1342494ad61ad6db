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

#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"
#include "host/libs/image/block_device.h"
#include "host/libs/image/content_stager.h"
#include "host/libs/image/image_test_helper.h"
#include "host/libs/image/interrupt.h"

namespace bootdisk {
namespace {

using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;
using testing::UnorderedElementsAre;

std::string ReadFile(const std::string& path) {
  std::string contents;
  EXPECT_TRUE(android::base::ReadFileToString(path, &contents)) << path;
  return contents;
}

class ContentStagerTest : public testing::Test {
 protected:
  void SetUp() override {
    source_ = std::string(source_dir_.path);
    device_ = std::string(device_dir_.path);
    temp_parent_ = std::string(temp_dir_.path);
  }

  BlockDeviceHandle Device() const {
    return BlockDeviceHandle("/dev/loop9", device_, "/tmp/disk.img");
  }

  BuildResult<StagingReport> Stage() {
    ContentStager stager(mounter_, StagingManifest::Default(), temp_parent_);
    return stager.Stage(Device(), source_);
  }

  std::vector<std::string> LeftoverMountPoints() {
    auto contents = DirectoryContents(temp_parent_);
    EXPECT_THAT(contents, IsOk());
    return contents.ok() ? *contents : std::vector<std::string>{};
  }

  TemporaryDir source_dir_;
  TemporaryDir device_dir_;
  TemporaryDir temp_dir_;
  std::string source_;
  std::string device_;
  std::string temp_parent_;
  DirectoryBackedMounter mounter_;
};

TEST_F(ContentStagerTest, StagesTheWholeTree) {
  CreateBootTreeForTest(source_);
  CreateFileForTest(source_, "boot/limine/limine-bios.sys", "stage2");
  CreateFileForTest(source_, "EFI/BOOT/BOOTX64.EFI", "efi");

  auto staged = Stage();

  ASSERT_THAT(staged, IsOk());
  EXPECT_EQ(staged->files, 4u);
  EXPECT_EQ(staged->directories, 4u);
  EXPECT_EQ(ReadFile(device_ + "/boot/limine/limine.cfg"),
            ReadFile(source_ + "/boot/limine/limine.cfg"));
  EXPECT_EQ(ReadFile(device_ + "/kernel.bin"), ReadFile(source_ + "/kernel.bin"));
  EXPECT_EQ(ReadFile(device_ + "/EFI/BOOT/BOOTX64.EFI"), "efi");
  EXPECT_EQ(mounter_.mounted(), 0);
  EXPECT_THAT(LeftoverMountPoints(), IsEmpty());
}

TEST_F(ContentStagerTest, MountsUnderTheTemporaryParent) {
  CreateBootTreeForTest(source_);

  ASSERT_THAT(Stage(), IsOk());

  ASSERT_EQ(mounter_.mount_points().size(), 1u);
  EXPECT_THAT(mounter_.mount_points()[0],
              HasSubstr(temp_parent_ + "/bootdisk-mnt-"));
}

TEST_F(ContentStagerTest, MissingArtifactIsAPreconditionFailure) {
  CreateFileForTest(source_, "kernel.bin", "kernel");

  auto staged = Stage();

  ASSERT_FALSE(staged.ok());
  EXPECT_EQ(staged.error().kind, BuildErrorKind::kPrecondition);
  EXPECT_THAT(staged.error().Message(), HasSubstr("boot/limine is missing"));
  EXPECT_THAT(mounter_.mount_points(), IsEmpty());
  EXPECT_THAT(LeftoverMountPoints(), IsEmpty());
}

TEST_F(ContentStagerTest, MountFailureRemovesTheMountPoint) {
  CreateBootTreeForTest(source_);
  mounter_.FailMount(true);

  auto staged = Stage();

  ASSERT_FALSE(staged.ok());
  EXPECT_EQ(staged.error().kind, BuildErrorKind::kMount);
  EXPECT_THAT(staged.error().leaks, IsEmpty());
  EXPECT_THAT(LeftoverMountPoints(), IsEmpty());
}

TEST_F(ContentStagerTest, UnstageableEntryIsACopyError) {
  CreateBootTreeForTest(source_);
  ASSERT_EQ(mkfifo((source_ + "/console").c_str(), 0600), 0);

  auto staged = Stage();

  ASSERT_FALSE(staged.ok());
  EXPECT_EQ(staged.error().kind, BuildErrorKind::kCopy);
  EXPECT_THAT(staged.error().Message(), HasSubstr("FIFO"));
  EXPECT_THAT(staged.error().leaks, IsEmpty());
  EXPECT_EQ(mounter_.mounted(), 0);
  EXPECT_THAT(LeftoverMountPoints(), IsEmpty());
}

TEST_F(ContentStagerTest, FailedUnmountLeavesTheMountPointAndReportsALeak) {
  CreateBootTreeForTest(source_);
  mounter_.FailUnmount(true);

  auto staged = Stage();

  ASSERT_FALSE(staged.ok());
  EXPECT_EQ(staged.error().kind, BuildErrorKind::kMount);
  // Still holding the staged files, so the directory is not removed.
  EXPECT_EQ(staged.error().leaks.size(), 1u);
  EXPECT_EQ(LeftoverMountPoints().size(), 1u);
  EXPECT_EQ(staged.error().ExitCode(), ExitCode(BuildErrorKind::kResourceLeak));
}

TEST_F(ContentStagerTest, StagingAgainAfterAFailureSucceeds) {
  CreateBootTreeForTest(source_);
  mounter_.FailMount(true);
  ASSERT_FALSE(Stage().ok());

  mounter_.FailMount(false);
  EXPECT_THAT(Stage(), IsOk());
  EXPECT_THAT(LeftoverMountPoints(), IsEmpty());
}

TEST_F(ContentStagerTest, InterruptStopsTheCopy) {
  CreateBootTreeForTest(source_);
  InterruptMonitor monitor;
  ASSERT_EQ(raise(SIGINT), 0);

  auto staged = Stage();
  ResetInterrupt();

  // The builder turns this into an interrupted build.
  ASSERT_FALSE(staged.ok());
  EXPECT_EQ(staged.error().kind, BuildErrorKind::kCopy);
  EXPECT_THAT(staged.error().Message(), HasSubstr("Interrupted by signal"));
  EXPECT_EQ(mounter_.mounted(), 0);
  EXPECT_THAT(LeftoverMountPoints(), IsEmpty());
}

TEST_F(ContentStagerTest, EntryMissingAfterTheCopyIsAVerificationError) {
  CreateBootTreeForTest(source_);
  mounter_.LoseOnFlush("kernel.bin");

  auto staged = Stage();

  ASSERT_FALSE(staged.ok());
  EXPECT_EQ(staged.error().kind, BuildErrorKind::kVerification);
  EXPECT_EQ(staged.error().ExitCode(), ExitCode(BuildErrorKind::kVerification));
  EXPECT_THAT(staged.error().Message(), HasSubstr("kernel.bin is missing"));
  EXPECT_THAT(staged.error().leaks, IsEmpty());
  EXPECT_EQ(mounter_.mounted(), 0);
  ASSERT_EQ(mounter_.mount_points().size(), 1u);
  EXPECT_FALSE(DirectoryExists(mounter_.mount_points()[0]));
  EXPECT_THAT(LeftoverMountPoints(), IsEmpty());
  // Whatever did make it onto the filesystem is still released to it.
  EXPECT_EQ(ReadFile(device_ + "/boot/limine/limine.cfg"),
            ReadFile(source_ + "/boot/limine/limine.cfg"));
}

TEST(CopyTreeTest, FollowsLinksAndKeepsModificationTimes) {
  TemporaryDir source;
  TemporaryDir destination;
  const std::string src(source.path);
  CreateFileForTest(src, "real/kernel.bin", "kernel");
  ASSERT_EQ(symlink("real/kernel.bin", (src + "/kernel.bin").c_str()), 0);
  struct timespec times[2] = {{1600000000, 0}, {1600000000, 0}};
  ASSERT_EQ(utimensat(AT_FDCWD, (src + "/real/kernel.bin").c_str(), times, 0),
            0);

  auto copied = CopyTree(src, destination.path);

  ASSERT_THAT(copied, IsOk());
  EXPECT_THAT(copied->entries,
              UnorderedElementsAre("real/", "real/kernel.bin", "kernel.bin"));
  const std::string dst(destination.path);
  struct stat st {};
  ASSERT_EQ(lstat((dst + "/kernel.bin").c_str(), &st), 0);
  EXPECT_TRUE(S_ISREG(st.st_mode));
  EXPECT_EQ(st.st_mtim.tv_sec, 1600000000);
  EXPECT_EQ(ReadFile(dst + "/kernel.bin"), "kernel");
}

TEST(CopyTreeTest, RejectsDirectoryLinkCycles) {
  TemporaryDir source;
  TemporaryDir destination;
  const std::string src(source.path);
  CreateFileForTest(src, "boot/limine.cfg");
  ASSERT_EQ(symlink("..", (src + "/boot/loop").c_str()), 0);

  EXPECT_THAT(CopyTree(src, destination.path),
              IsErrorAndMessage(HasSubstr("links back")));
}

TEST(CopyTreeTest, EmptyDirectoriesAreStaged) {
  TemporaryDir source;
  TemporaryDir destination;
  const std::string src(source.path);
  ASSERT_EQ(mkdir((src + "/empty").c_str(), 0755), 0);

  auto copied = CopyTree(src, destination.path);

  ASSERT_THAT(copied, IsOk());
  EXPECT_THAT(copied->entries, ElementsAre("empty/"));
  EXPECT_TRUE(DirectoryExists(std::string(destination.path) + "/empty"));
}

TEST(VerifyStagedTreeTest, ReportsMissingAndTruncatedEntries) {
  TemporaryDir source;
  TemporaryDir destination;
  CreateFileForTest(source.path, "kernel.bin", "0123456789");
  CreateFileForTest(source.path, "boot/limine/limine.cfg", "cfg");
  CreateFileForTest(destination.path, "kernel.bin", "01234");

  auto verified = VerifyStagedTree(source.path, destination.path);

  EXPECT_THAT(verified, IsErrorAndMessage(HasSubstr("boot is missing")));
  EXPECT_THAT(verified,
              IsErrorAndMessage(HasSubstr("kernel.bin is 5 bytes instead of "
                                          "10")));
}

TEST(VerifyStagedTreeTest, AcceptsACopy) {
  TemporaryDir source;
  TemporaryDir destination;
  CreateBootTreeForTest(source.path);
  ASSERT_THAT(CopyTree(source.path, destination.path), IsOk());

  EXPECT_THAT(VerifyStagedTree(source.path, destination.path), IsOk());
}

TEST(RemoveMountPointTest, RefusesWhileMounted) {
  EXPECT_THAT(RemoveMountPoint("/"),
              IsErrorAndMessage(HasSubstr("still a mount point")));
}

TEST(RemoveMountPointTest, RemovesAnEmptyDirectory) {
  TemporaryDir parent;
  auto dir = CreateTempDirectory(parent.path, "bootdisk-mnt-");
  ASSERT_THAT(dir, IsOk());

  EXPECT_THAT(RemoveMountPoint(*dir), IsOk());
  EXPECT_FALSE(DirectoryExists(*dir));
}

TEST(FormatStagedTreeTest, ListsEveryEntry) {
  StagingReport report;
  report.entries = {"boot/", "boot/limine/", "boot/limine/limine.cfg",
                    "kernel.bin"};
  report.files = 2;
  report.directories = 2;
  report.bytes = 10;

  EXPECT_EQ(FormatStagedTree(report),
            "Disk contents (2 files, 2 directories, 10 bytes):\n"
            "  boot/\n"
            "  boot/limine/\n"
            "  boot/limine/limine.cfg\n"
            "  kernel.bin");
}

}  // namespace
}  // namespace bootdisk
