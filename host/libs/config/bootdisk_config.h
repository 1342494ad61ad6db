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
#pragma once

#include <cstdint>
#include <map>
#include <string>

#include <json/json.h>

#include "common/libs/utils/result.h"
#include "host/libs/image/disk_builder.h"
#include "host/libs/image/staging_manifest.h"

namespace bootdisk {

// Relative to the workspace.
constexpr char kDefaultSourceDir[] = "build/disk";
constexpr char kDefaultImage[] = "build/disk.img";

/**
 * Everything a single mkbootdisk invocation is configured with.
 *
 * Empty paths are derived from the workspace layout by ResolvePaths().
 */
struct BootdiskConfig {
  std::string workspace;
  std::string source_dir;
  std::string image;
  uint64_t image_size_mb = 64;
  uint64_t partition_offset_mb = 1;
  std::string filesystem = "fat32";
  std::string partitioner = "mbr";
  std::string binder = "losetup";
  std::string volume_label = "BOOTDISK";
  std::string volume_id = "0x1DB00710";
  std::string bootloader_artifact;
  std::string required_artifacts;
  std::string bootloader_install_tool;
  bool lock_image = true;
  std::string report_file;
  std::string log_file;
  std::string verbosity = "INFO";
};

// Fills in the workspace (current directory), source directory and image
// from the fixed layout and makes every path absolute.
Result<void> ResolvePaths(BootdiskConfig& config);

// Accepts "0x1DB00710", "1DB00710" and "1DB0-0710".
Result<uint32_t> ParseVolumeId(const std::string& value);

// The default Limine manifest, or --required_artifacts when given, plus the
// bootloader artifact if one is named.
Result<StagingManifest> ManifestFromConfig(const BootdiskConfig& config);

// Requires ResolvePaths() to have run.
Result<BuildRequest> BuildRequestFromConfig(const BootdiskConfig& config);
Result<BuildTools> BuildToolsFromConfig(const BootdiskConfig& config);

/**
 * Reads a JSON object of flag defaults from `path`.
 *
 * Keys are flag names without dashes. Scalar values are converted to the
 * text form a command line would carry them in ("64", "true"); arrays of
 * strings are joined with commas. Nested objects are rejected.
 */
Result<std::map<std::string, std::string>> ReadFlagDefaults(
    const std::string& path);
Result<std::map<std::string, std::string>> FlagDefaultsFromJson(
    const Json::Value& root);

}  // namespace bootdisk
