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
#include <string>

#include "common/libs/fs/shared_fd.h"
#include "common/libs/utils/result.h"
#include "common/libs/utils/size_utils.h"

namespace bootdisk {

constexpr uint8_t kMbrBootable = 0x80;
constexpr uint8_t kMbrTypeFat32Chs = 0x0B;
constexpr uint8_t kMbrTypeFat32Lba = 0x0C;

struct __attribute__((packed)) MbrPartitionEntry {
  std::uint8_t status;
  std::uint8_t begin_chs[3];
  std::uint8_t partition_type;
  std::uint8_t end_chs[3];
  std::uint32_t first_lba;
  std::uint32_t num_sectors;
};

struct __attribute__((packed)) MasterBootRecord {
  std::uint8_t bootstrap_code[440];
  std::uint32_t disk_signature;
  std::uint16_t reserved;
  MbrPartitionEntry partitions[4];
  std::uint8_t boot_signature[2];
};

static_assert(sizeof(MbrPartitionEntry) == 16);
static_assert(sizeof(MasterBootRecord) == kSectorSize);

// CHS address of `lba` for a 255 head, 63 sector geometry, clamped to
// 1023/254/63 when the cylinder does not fit.
void EncodeChs(uint64_t lba, uint8_t chs[3]);

// A table with one bootable FAT32 (LBA) entry covering `num_sectors` sectors
// from `first_lba`.
MasterBootRecord MakeSinglePartitionMbr(uint32_t first_lba,
                                        uint32_t num_sectors,
                                        uint32_t disk_signature);

bool HasBootSignature(const MasterBootRecord& mbr);
// Number of entries with a non-zero partition type.
int UsedPartitionCount(const MasterBootRecord& mbr);

Result<MasterBootRecord> ReadMbr(SharedFD fd);
Result<MasterBootRecord> ReadMbr(const std::string& image);
// Writes sector 0 only.
Result<void> WriteMbr(SharedFD fd, const MasterBootRecord& mbr);

}  // namespace bootdisk
