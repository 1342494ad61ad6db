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
#include <ostream>
#include <string>

#include "common/libs/utils/result.h"
#include "common/libs/utils/size_utils.h"

namespace bootdisk {

enum class FilesystemType {
  kFat32,
};

std::string ToString(FilesystemType type);
Result<FilesystemType> ParseFilesystemType(const std::string& name);

// The smallest volume, in sectors, that FAT32 is defined for.
constexpr uint64_t kMinFat32Sectors = 66600;
constexpr uint64_t kMinFat32Bytes = kMinFat32Sectors * kSectorSize;

// The geometry of the image to build. The single partition always runs from
// `partition_offset_bytes` to the end of the image.
struct ImageSpec {
  std::string path;
  uint64_t total_size_bytes = MiBToBytes(64);
  uint64_t partition_offset_bytes = MiBToBytes(1);
  std::string partition_tag = "boot, primary";
  FilesystemType filesystem = FilesystemType::kFat32;

  uint64_t PartitionSizeBytes() const {
    return total_size_bytes - partition_offset_bytes;
  }
  uint64_t PartitionFirstLba() const {
    return partition_offset_bytes / kSectorSize;
  }
  uint64_t PartitionSectors() const { return PartitionSizeBytes() / kSectorSize; }
};

std::ostream& operator<<(std::ostream& out, const ImageSpec& spec);

Result<void> ValidateImageSpec(const ImageSpec& spec);

}  // namespace bootdisk
