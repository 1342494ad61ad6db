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

#include "host/libs/config/bootdisk_config.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/parseint.h>
#include <android-base/strings.h>
#include <json/json.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/json.h"
#include "common/libs/utils/size_utils.h"
#include "host/libs/image/block_device.h"
#include "host/libs/image/bootloader_installer.h"
#include "host/libs/image/formatter.h"
#include "host/libs/image/image_spec.h"
#include "host/libs/image/mounter.h"
#include "host/libs/image/partitioner.h"

namespace bootdisk {
namespace {

std::string InWorkspace(const std::string& workspace,
                        const std::string& relative) {
  return workspace + "/" + relative;
}

}  // namespace

Result<void> ResolvePaths(BootdiskConfig& config) {
  if (config.workspace.empty()) {
    config.workspace = CurrentDirectory();
  }
  config.workspace = AbsolutePath(config.workspace);
  BD_EXPECT(!config.workspace.empty(), "Could not resolve the workspace");
  if (config.source_dir.empty()) {
    config.source_dir = InWorkspace(config.workspace, kDefaultSourceDir);
  }
  if (config.image.empty()) {
    config.image = InWorkspace(config.workspace, kDefaultImage);
  }
  config.source_dir = AbsolutePath(config.source_dir);
  config.image = AbsolutePath(config.image);
  BD_EXPECT(!config.source_dir.empty(), "Could not resolve the source dir");
  BD_EXPECT(!config.image.empty(), "Could not resolve the image path");
  if (!config.report_file.empty()) {
    config.report_file = AbsolutePath(config.report_file);
    BD_EXPECT(!config.report_file.empty(), "Could not resolve --report_file");
    // Checked now: the report is written only once the image is published.
    auto report_dir = android::base::Dirname(config.report_file);
    BD_EXPECTF(DirectoryExists(report_dir),
               "The directory \"{}\" for --report_file does not exist",
               report_dir);
  }
  return {};
}

Result<uint32_t> ParseVolumeId(const std::string& value) {
  std::string digits = value;
  digits.erase(std::remove(digits.begin(), digits.end(), '-'), digits.end());
  if (!android::base::StartsWith(digits, "0x") &&
      !android::base::StartsWith(digits, "0X")) {
    digits = "0x" + digits;
  }
  uint32_t volume_id = 0;
  BD_EXPECTF(digits.size() > 2 && digits.size() <= 10 &&
                 android::base::ParseUint(digits, &volume_id),
             "\"{}\" is not a 32-bit hexadecimal volume id", value);
  return volume_id;
}

Result<StagingManifest> ManifestFromConfig(const BootdiskConfig& config) {
  auto manifest = StagingManifest::Default();
  if (!config.required_artifacts.empty()) {
    manifest = BD_EXPECT(StagingManifest::Parse(config.required_artifacts),
                         "Invalid --required_artifacts");
  }
  if (!config.bootloader_artifact.empty()) {
    BD_EXPECT(manifest.Add(RequiredArtifact{config.bootloader_artifact,
                                            ArtifactKind::kFile}),
              "Invalid --bootloader_artifact");
  }
  return manifest;
}

Result<BuildRequest> BuildRequestFromConfig(const BootdiskConfig& config) {
  constexpr uint64_t kMaxMiB = std::numeric_limits<uint64_t>::max() / kMiB;
  BD_EXPECTF(config.image_size_mb <= kMaxMiB, "--image_size_mb={} is too "
             "large", config.image_size_mb);
  BD_EXPECTF(config.partition_offset_mb <= kMaxMiB, "--partition_offset_mb={} "
             "is too large", config.partition_offset_mb);

  BuildRequest request;
  request.spec.path = config.image;
  request.spec.total_size_bytes = MiBToBytes(config.image_size_mb);
  request.spec.partition_offset_bytes = MiBToBytes(config.partition_offset_mb);
  request.spec.filesystem = BD_EXPECT(ParseFilesystemType(config.filesystem));
  request.source_dir = config.source_dir;
  request.manifest = BD_EXPECT(ManifestFromConfig(config));
  request.format.volume_label = config.volume_label;
  request.format.volume_id = BD_EXPECT(ParseVolumeId(config.volume_id));
  request.lock_image = config.lock_image;
  return request;
}

Result<BuildTools> BuildToolsFromConfig(const BootdiskConfig& config) {
  // The partition table's disk signature doubles as the FAT volume id, so
  // both are reproducible from the one setting.
  auto disk_signature = BD_EXPECT(ParseVolumeId(config.volume_id));
  BuildTools tools;
  tools.partitioner =
      BD_EXPECT(CreatePartitioner(config.partitioner, disk_signature));
  tools.binder = BD_EXPECT(CreateDeviceBinder(config.binder));
  tools.formatter = std::make_unique<MkfsFatFormatter>();
  tools.mounter = std::make_unique<VfatMounter>();
  if (!config.bootloader_install_tool.empty()) {
    tools.bootloader_installer =
        std::make_unique<LimineInstaller>(config.bootloader_install_tool);
  }
  return tools;
}

Result<std::map<std::string, std::string>> FlagDefaultsFromJson(
    const Json::Value& root) {
  BD_EXPECT(root.isObject(), "The configuration must be a JSON object");
  std::map<std::string, std::string> defaults;
  for (const auto& name : root.getMemberNames()) {
    const auto& value = root[name];
    if (value.isString()) {
      defaults[name] = value.asString();
    } else if (value.isBool()) {
      defaults[name] = value.asBool() ? "true" : "false";
    } else if (value.isUInt64()) {
      defaults[name] = std::to_string(value.asUInt64());
    } else if (value.isInt64()) {
      defaults[name] = std::to_string(value.asInt64());
    } else if (value.isArray()) {
      auto elements = BD_EXPECTF(As<std::vector<std::string>>(value),
                                 "Bad value for \"{}\"", name);
      defaults[name] = android::base::Join(elements, ",");
    } else {
      return BD_ERRF("\"{}\" must be a string, boolean, integer or array of "
                     "strings",
                     name);
    }
  }
  return defaults;
}

Result<std::map<std::string, std::string>> ReadFlagDefaults(
    const std::string& path) {
  auto root = BD_EXPECT(LoadFromFile(path));
  auto defaults = BD_EXPECTF(FlagDefaultsFromJson(root),
                             "Invalid configuration in \"{}\"", path);
  LOG(DEBUG) << "Read " << defaults.size() << " flag defaults from " << path;
  return defaults;
}

}  // namespace bootdisk
