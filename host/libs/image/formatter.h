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
#include <memory>
#include <string>

#include "common/libs/utils/result.h"
#include "host/libs/image/block_device.h"

namespace bootdisk {

struct FormatOptions {
  std::string volume_label = "BOOTDISK";
  uint32_t volume_id = 0x1DB00710;
  uint64_t partition_size_bytes = 0;
};

// Sectors per cluster for a FAT32 volume of `capacity_bytes`, following the
// Microsoft FAT32 capacity table.
int SectorsPerClusterForCapacity(uint64_t capacity_bytes);

// FAT labels are at most 11 characters of upper case printable ASCII and may
// not contain the characters DOS reserves.
Result<void> ValidateVolumeLabel(const std::string& label);

class Formatter {
 public:
  virtual ~Formatter() = default;

  virtual std::string Name() const = 0;
  virtual Result<void> CheckAvailable() const { return {}; }
  // Writes an empty FAT32 filesystem on the partition node of `device`.
  virtual Result<void> Format(const BlockDeviceHandle& device,
                              const FormatOptions& options) = 0;
};

// Uses mkfs.fat from dosfstools.
class MkfsFatFormatter : public Formatter {
 public:
  std::string Name() const override { return "mkfs.fat"; }
  Result<void> CheckAvailable() const override;
  Result<void> Format(const BlockDeviceHandle& device,
                      const FormatOptions& options) override;
};

}  // namespace bootdisk
