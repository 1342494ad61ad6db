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
#include "host/libs/image/image_spec.h"

namespace bootdisk {

// Writes the partition table of a freshly allocated image.
class Partitioner {
 public:
  virtual ~Partitioner() = default;

  virtual std::string Name() const = 0;
  // Whatever the partitioner needs from the host, checked before anything
  // is written.
  virtual Result<void> CheckAvailable() const { return {}; }
  // Writes a table with a single bootable FAT32 partition covering
  // `spec.partition_offset_bytes` to the end of `image`.
  virtual Result<void> Partition(const std::string& image,
                                 const ImageSpec& spec) = 0;
};

// Writes the MBR directly. The disk signature makes the output reproducible.
class MbrPartitioner : public Partitioner {
 public:
  explicit MbrPartitioner(uint32_t disk_signature)
      : disk_signature_(disk_signature) {}

  std::string Name() const override { return "mbr"; }
  Result<void> Partition(const std::string& image,
                         const ImageSpec& spec) override;

 private:
  uint32_t disk_signature_;
};

// Delegates to `parted -s`.
class PartedPartitioner : public Partitioner {
 public:
  std::string Name() const override { return "parted"; }
  Result<void> CheckAvailable() const override;
  Result<void> Partition(const std::string& image,
                         const ImageSpec& spec) override;
};

Result<std::unique_ptr<Partitioner>> CreatePartitioner(
    const std::string& name, uint32_t disk_signature);

// Checks that `image` holds exactly the table described by `spec`: one
// bootable FAT32 entry from the partition offset to the end of the image.
Result<void> VerifyPartitionTable(const std::string& image,
                                  const ImageSpec& spec);

}  // namespace bootdisk
