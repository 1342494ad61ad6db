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

#include "host/libs/image/content_stager.h"

#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <cerrno>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>

#include "common/libs/utils/files.h"
#include "host/libs/image/interrupt.h"

namespace bootdisk {
namespace {

constexpr char kMountPointPrefix[] = "bootdisk-mnt-";
// Verification keeps going after a mismatch; past this many the rest are
// only counted.
constexpr size_t kMaxReportedMismatches = 20;

using InodeSet = std::set<std::pair<dev_t, ino_t>>;

std::string Describe(mode_t mode) {
  if (S_ISSOCK(mode)) {
    return "socket";
  } else if (S_ISFIFO(mode)) {
    return "FIFO";
  } else if (S_ISCHR(mode)) {
    return "character device";
  } else if (S_ISBLK(mode)) {
    return "block device";
  }
  return "special file";
}

Result<void> CopyTimes(const std::string& path, const struct stat& source) {
  struct timespec times[2] = {source.st_atim, source.st_mtim};
  BD_EXPECTF(utimensat(AT_FDCWD, path.c_str(), times, 0) == 0,
             "Failed to set the times of \"{}\": {}", path, strerror(errno));
  return {};
}

Result<void> CopyDirectory(const std::string& source,
                           const std::string& destination,
                           const std::string& relative, InodeSet& ancestors,
                           StagingReport& report) {
  auto names = BD_EXPECT(DirectoryContents(source));
  for (const auto& name : names) {
    BD_EXPECT(CheckNotInterrupted());
    const auto from = source + "/" + name;
    const auto to = destination + "/" + name;
    const auto entry = relative.empty() ? name : relative + "/" + name;

    struct stat st {};
    // stat, not lstat: FAT has no symbolic links, so links are staged as
    // what they point to.
    BD_EXPECTF(stat(from.c_str(), &st) == 0, "Cannot read \"{}\": {}", from,
               strerror(errno));
    struct stat existing {};
    BD_EXPECTF(lstat(to.c_str(), &existing) != 0,
               "\"{}\" collides with an entry already staged (FAT names are "
               "case insensitive)",
               entry);

    if (S_ISDIR(st.st_mode)) {
      auto inode = std::make_pair(st.st_dev, st.st_ino);
      BD_EXPECTF(ancestors.count(inode) == 0,
                 "\"{}\" links back to one of its parent directories", entry);
      BD_EXPECTF(mkdir(to.c_str(), 0755) == 0,
                 "Failed to create directory \"{}\": {}", to, strerror(errno));
      report.entries.push_back(entry + "/");
      report.directories++;
      ancestors.insert(inode);
      BD_EXPECT(CopyDirectory(from, to, entry, ancestors, report));
      ancestors.erase(inode);
      BD_EXPECT(CopyTimes(to, st));
    } else if (S_ISREG(st.st_mode)) {
      auto copied = BD_EXPECTF(Copy(from, to), "Failed to copy \"{}\"", entry);
      BD_EXPECTF(copied == st.st_size,
                 "\"{}\" changed size while being copied ({} of {} bytes)",
                 entry, copied, st.st_size);
      BD_EXPECT(CopyTimes(to, st));
      report.entries.push_back(entry);
      report.files++;
      report.bytes += copied;
    } else {
      return BD_ERRF("\"{}\" is a {}, which cannot be staged", entry,
                     Describe(st.st_mode));
    }
  }
  return {};
}

Result<void> VerifyDirectory(const std::string& source,
                             const std::string& destination,
                             const std::string& relative,
                             std::vector<std::string>& mismatches,
                             size_t& mismatch_count) {
  auto names = BD_EXPECT(DirectoryContents(source));
  for (const auto& name : names) {
    const auto from = source + "/" + name;
    const auto to = destination + "/" + name;
    const auto entry = relative.empty() ? name : relative + "/" + name;

    struct stat src {};
    BD_EXPECTF(stat(from.c_str(), &src) == 0, "Cannot read \"{}\": {}", from,
               strerror(errno));
    std::optional<std::string> problem;
    struct stat dst {};
    if (stat(to.c_str(), &dst) != 0) {
      problem = entry + " is missing";
    } else if (S_ISDIR(src.st_mode) != S_ISDIR(dst.st_mode)) {
      problem = entry + " has the wrong kind";
    } else if (S_ISREG(src.st_mode) && src.st_size != dst.st_size) {
      problem = fmt::format("{} is {} bytes instead of {}", entry,
                            dst.st_size, src.st_size);
    }
    if (problem) {
      if (mismatch_count++ < kMaxReportedMismatches) {
        mismatches.push_back(*problem);
      }
      continue;
    }
    if (S_ISDIR(src.st_mode)) {
      BD_EXPECT(VerifyDirectory(from, to, entry, mismatches, mismatch_count));
    }
  }
  return {};
}

}  // namespace

Result<StagingReport> CopyTree(const std::string& source,
                               const std::string& destination) {
  StagingReport report;
  struct stat st {};
  BD_EXPECTF(stat(source.c_str(), &st) == 0 && S_ISDIR(st.st_mode),
             "\"{}\" is not a directory", source);
  InodeSet ancestors = {{st.st_dev, st.st_ino}};
  BD_EXPECT(CopyDirectory(source, destination, "", ancestors, report));
  return report;
}

Result<void> VerifyStagedTree(const std::string& source,
                              const std::string& destination) {
  std::vector<std::string> mismatches;
  size_t mismatch_count = 0;
  BD_EXPECT(VerifyDirectory(source, destination, "", mismatches,
                            mismatch_count));
  if (mismatch_count > mismatches.size()) {
    mismatches.push_back(fmt::format(
        "and {} more", mismatch_count - mismatches.size()));
  }
  BD_EXPECTF(mismatches.empty(), "Staged tree does not match \"{}\": {}",
             source, android::base::Join(mismatches, "; "));
  return {};
}

std::string FormatStagedTree(const StagingReport& report) {
  std::stringstream listing;
  listing << "Disk contents (" << report.files << " files, "
          << report.directories << " directories, " << report.bytes
          << " bytes):";
  for (const auto& entry : report.entries) {
    listing << "\n  " << entry;
  }
  return listing.str();
}

Result<void> RemoveMountPoint(const std::string& directory) {
  auto mounted = BD_EXPECT(IsMountPoint(directory));
  BD_EXPECTF(!mounted, "\"{}\" is still a mount point, leaving it in place",
             directory);
  BD_EXPECT(RemoveEmptyDirectory(directory));
  return {};
}

ContentStager::ContentStager(Mounter& mounter, StagingManifest manifest,
                             std::string temp_parent)
    : mounter_(mounter),
      manifest_(std::move(manifest)),
      temp_parent_(std::move(temp_parent)) {}

BuildResult<StagingReport> ContentStager::Stage(
    const BlockDeviceHandle& device, const std::string& source_dir) {
  CleanupStack cleanup;
  auto staged = StageWithCleanup(device, source_dir, cleanup);
  if (!staged.ok()) {
    auto unwound = cleanup.Unwind();
    if (!unwound.ok()) {
      staged.error().leaks.push_back(std::move(unwound.error()));
    }
  }
  return staged;
}

BuildResult<StagingReport> ContentStager::StageWithCleanup(
    const BlockDeviceHandle& device, const std::string& source_dir,
    CleanupStack& cleanup) {
  BD_EXPECT_KIND(BuildErrorKind::kPrecondition, manifest_.Check(source_dir),
                 "The build output is incomplete");

  auto mount_point = BD_EXPECT_KIND(
      BuildErrorKind::kMount,
      CreateTempDirectory(temp_parent_, kMountPointPrefix),
      "Failed to create a mount point");
  cleanup.Push("mount point " + mount_point,
               [mount_point]() { return RemoveMountPoint(mount_point); });

  auto mounted = BD_EXPECT_KIND(
      BuildErrorKind::kMount,
      mounter_.Mount(device.partition_device(), mount_point),
      "Failed to mount " << device.partition_device());
  // Shared with the release so that either the release or the success path
  // below hands the handle back, never both.
  auto handle = std::make_shared<std::optional<MountHandle>>(std::move(mounted));
  cleanup.Push("mount " + mount_point, [this, handle]() -> Result<void> {
    BD_EXPECT(handle->has_value(), "Mount already released");
    MountHandle released = std::move(**handle);
    handle->reset();
    return mounter_.Unmount(std::move(released));
  });

  auto report = BD_EXPECT_KIND(BuildErrorKind::kCopy,
                               CopyTree(source_dir, mount_point),
                               "Failed to copy " << source_dir);
  BD_EXPECT_KIND(BuildErrorKind::kCopy, mounter_.Flush(**handle),
                 "Failed to write back the staged files");

  BD_EXPECT_KIND(BuildErrorKind::kVerification, manifest_.Check(mount_point),
                 "Required artifacts are missing after the copy");
  BD_EXPECT_KIND(BuildErrorKind::kVerification,
                 VerifyStagedTree(source_dir, mount_point),
                 "Staged contents differ from the source");
  LOG(INFO) << FormatStagedTree(report);

  BD_EXPECT_KIND(BuildErrorKind::kMount, cleanup.Pop("mount " + mount_point),
                 "Failed to unmount the staged filesystem");
  BD_EXPECT_KIND(BuildErrorKind::kMount,
                 cleanup.Pop("mount point " + mount_point),
                 "Failed to remove the mount point");
  return report;
}

}  // namespace bootdisk
