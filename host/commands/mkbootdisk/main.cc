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

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <gflags/gflags.h>

#include "common/libs/utils/result.h"
#include "common/libs/utils/tee_logging.h"
#include "host/libs/config/bootdisk_config.h"
#include "host/libs/image/build_error.h"
#include "host/libs/image/build_report.h"
#include "host/libs/image/disk_builder.h"
#include "host/libs/image/interrupt.h"

DEFINE_string(workspace, "",
              "Root of the workspace layout. Defaults to the current "
              "directory.");
DEFINE_string(source_dir, "",
              "Build output tree to stage. Defaults to "
              "<workspace>/build/disk.");
DEFINE_string(image, "",
              "Disk image to write, overwritten if it exists. Defaults to "
              "<workspace>/build/disk.img.");
DEFINE_uint64(image_size_mb, 64, "Total size of the image in MiB.");
DEFINE_uint64(partition_offset_mb, 1,
              "Where the boot partition starts, in MiB.");
DEFINE_string(filesystem, "fat32",
              "Filesystem of the boot partition. Only fat32 is supported.");
DEFINE_string(partitioner, "mbr",
              "How the partition table is written: mbr (natively) or parted.");
DEFINE_string(binder, "losetup",
              "How the image is attached as a block device: losetup or "
              "loop-control.");
DEFINE_string(volume_label, "BOOTDISK", "FAT volume label, up to 11 chars.");
DEFINE_string(volume_id, "0x1DB00710",
              "FAT volume id, also used as the MBR disk signature.");
DEFINE_string(bootloader_artifact, "",
              "Relative path of the bootloader binary in the build output, "
              "e.g. boot/limine/limine-bios.sys. Required when set.");
DEFINE_string(required_artifacts, "",
              "Comma separated relative paths that must be staged, replacing "
              "boot/limine/,kernel.bin. A trailing '/' marks a directory.");
DEFINE_string(bootloader_install_tool, "",
              "Limine host utility to run `bios-install` with on the finished "
              "image.");
DEFINE_bool(lock_image, true,
            "Refuse to run while another build writes the same image.");
DEFINE_string(report_file, "", "Write a JSON build report here on success.");
DEFINE_string(log_file, "", "Also write the full log to this file.");
DEFINE_string(config_file, "",
              "JSON object of flag defaults; explicit flags take precedence.");
DEFINE_string(verbosity, "INFO",
              "Console log severity: VERBOSE, DEBUG, INFO, WARNING or ERROR.");

namespace bootdisk {
namespace {

constexpr char kUsageMessage[] =
    "Assembles a bootable disk image from a build output directory.\n"
    "\n"
    "  mkbootdisk [--source_dir=build/disk] [--image=build/disk.img]\n"
    "\n"
    "The image gets an MBR with one bootable FAT32 partition holding a copy\n"
    "of the build output. Needs root to attach and mount the image.";

constexpr int kInvalidInvocation = 1;

// Flags given on the command line keep their values; every other flag named
// in the file gets the file's value.
Result<void> ApplyConfigFile(const std::string& path) {
  auto defaults = BD_EXPECT(ReadFlagDefaults(path));
  for (const auto& [name, value] : defaults) {
    BD_EXPECTF(name != "config_file", "\"{}\" cannot set config_file", path);
    gflags::CommandLineFlagInfo info;
    BD_EXPECTF(gflags::GetCommandLineFlagInfo(name.c_str(), &info),
               "Unknown flag \"{}\" in \"{}\"", name, path);
    if (!info.is_default) {
      LOG(DEBUG) << "--" << name << " given explicitly, ignoring " << path;
      continue;
    }
    BD_EXPECTF(!gflags::SetCommandLineOption(name.c_str(), value.c_str())
                    .empty(),
               "Invalid value \"{}\" for \"{}\" in \"{}\"", value, name, path);
  }
  return {};
}

BootdiskConfig ConfigFromFlags() {
  BootdiskConfig config;
  config.workspace = FLAGS_workspace;
  config.source_dir = FLAGS_source_dir;
  config.image = FLAGS_image;
  config.image_size_mb = FLAGS_image_size_mb;
  config.partition_offset_mb = FLAGS_partition_offset_mb;
  config.filesystem = FLAGS_filesystem;
  config.partitioner = FLAGS_partitioner;
  config.binder = FLAGS_binder;
  config.volume_label = FLAGS_volume_label;
  config.volume_id = FLAGS_volume_id;
  config.bootloader_artifact = FLAGS_bootloader_artifact;
  config.required_artifacts = FLAGS_required_artifacts;
  config.bootloader_install_tool = FLAGS_bootloader_install_tool;
  config.lock_image = FLAGS_lock_image;
  config.report_file = FLAGS_report_file;
  config.log_file = FLAGS_log_file;
  config.verbosity = FLAGS_verbosity;
  return config;
}

Result<void> SetUpLogging(const BootdiskConfig& config) {
  auto console_severity = BD_EXPECT(ParseSeverity(config.verbosity),
                                    "Invalid --verbosity");
  std::vector<std::string> log_files;
  if (!config.log_file.empty()) {
    log_files.push_back(config.log_file);
  }
  auto logger =
      BD_EXPECT(LogToStderrAndFiles(log_files, console_severity));
  android::base::SetLogger(std::move(logger));
  return {};
}

Result<int> MkbootdiskMain(int argc, char** argv) {
  ::android::base::InitLogging(argv, android::base::StderrLogger);
  gflags::SetUsageMessage(kUsageMessage);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  BD_EXPECTF(argc == 1, "Unexpected argument \"{}\"", argv[1]);

  if (!FLAGS_config_file.empty()) {
    BD_EXPECT(ApplyConfigFile(FLAGS_config_file));
  }
  auto config = ConfigFromFlags();
  BD_EXPECT(SetUpLogging(config));
  BD_EXPECT(ResolvePaths(config));
  auto request = BD_EXPECT(BuildRequestFromConfig(config));
  auto tools = BD_EXPECT(BuildToolsFromConfig(config));

  // Installed before anything is acquired, so an interrupt at any point
  // unwinds through the build's releases.
  InterruptMonitor interrupts;
  DiskBuilder builder(std::move(tools));
  auto built = builder.Build(request);
  if (!built.ok()) {
    const auto& error = built.error();
    LOG(DEBUG) << error.trace.Trace();
    for (const auto& leak : error.leaks) {
      LOG(ERROR) << ToString(BuildErrorKind::kResourceLeak) << ": "
                 << leak.Message();
    }
    LOG(ERROR) << "mkbootdisk failed in " << error.Message();
    return error.ExitCode();
  }

  if (!config.report_file.empty()) {
    // The image is already published, so a missing report does not fail the
    // build.
    auto written = WriteBuildReport(config.report_file, *built);
    if (!written.ok()) {
      LOG(ERROR) << written.error().Message();
      LOG(DEBUG) << written.error().Trace();
    }
  }
  LOG(INFO) << "Bootable image ready at " << built->image;
  return 0;
}

}  // namespace
}  // namespace bootdisk

int main(int argc, char** argv) {
  auto result = bootdisk::MkbootdiskMain(argc, argv);
  if (!result.ok()) {
    LOG(ERROR) << result.error().Message();
    LOG(DEBUG) << result.error().Trace();
    return bootdisk::kInvalidInvocation;
  }
  return *result;
}
