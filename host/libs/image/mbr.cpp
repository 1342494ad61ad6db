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

#include "host/libs/image/mbr.h"

#include <fcntl.h>

#include <cstdint>
#include <cstring>
#include <string>

#include "common/libs/fs/shared_buf.h"

namespace bootdisk {
namespace {

constexpr uint64_t kHeads = 255;
constexpr uint64_t kSectorsPerTrack = 63;
constexpr uint64_t kMaxCylinder = 1023;

}  // namespace

void EncodeChs(uint64_t lba, uint8_t chs[3]) {
  uint64_t cylinder = lba / (kHeads * kSectorsPerTrack);
  uint64_t head = (lba / kSectorsPerTrack) % kHeads;
  uint64_t sector = (lba % kSectorsPerTrack) + 1;
  if (cylinder > kMaxCylinder) {
    cylinder = kMaxCylinder;
    head = kHeads - 1;
    sector = kSectorsPerTrack;
  }
  chs[0] = static_cast<uint8_t>(head);
  chs[1] = static_cast<uint8_t>((sector & 0x3f) | ((cylinder >> 2) & 0xc0));
  chs[2] = static_cast<uint8_t>(cylinder & 0xff);
}

MasterBootRecord MakeSinglePartitionMbr(uint32_t first_lba,
                                        uint32_t num_sectors,
                                        uint32_t disk_signature) {
  MasterBootRecord mbr;
  memset(&mbr, 0, sizeof(mbr));
  mbr.disk_signature = disk_signature;
  auto& entry = mbr.partitions[0];
  entry.status = kMbrBootable;
  entry.partition_type = kMbrTypeFat32Lba;
  EncodeChs(first_lba, entry.begin_chs);
  EncodeChs(static_cast<uint64_t>(first_lba) + num_sectors - 1,
            entry.end_chs);
  entry.first_lba = first_lba;
  entry.num_sectors = num_sectors;
  mbr.boot_signature[0] = 0x55;
  mbr.boot_signature[1] = 0xAA;
  return mbr;
}

bool HasBootSignature(const MasterBootRecord& mbr) {
  return mbr.boot_signature[0] == 0x55 && mbr.boot_signature[1] == 0xAA;
}

int UsedPartitionCount(const MasterBootRecord& mbr) {
  int count = 0;
  for (const auto& entry : mbr.partitions) {
    if (entry.partition_type != 0) {
      count++;
    }
  }
  return count;
}

Result<MasterBootRecord> ReadMbr(SharedFD fd) {
  MasterBootRecord mbr;
  auto read = PReadExactBinary(fd, &mbr, 0);
  BD_EXPECTF(read == static_cast<ssize_t>(sizeof(mbr)),
             "Failed to read the partition table: {}",
             read < 0 ? fd->StrError() : std::string("short read"));
  return mbr;
}

Result<MasterBootRecord> ReadMbr(const std::string& image) {
  auto fd = SharedFD::Open(image, O_RDONLY);
  BD_EXPECTF(fd->IsOpen(), "Failed to open \"{}\": {}", image, fd->StrError());
  return BD_EXPECT(ReadMbr(fd), "in " << image);
}

Result<void> WriteMbr(SharedFD fd, const MasterBootRecord& mbr) {
  BD_EXPECTF(PWriteAllBinary(fd, &mbr, 0) ==
                 static_cast<ssize_t>(sizeof(mbr)),
             "Writing the partition table failed: {}", fd->StrError());
  BD_EXPECTF(fd->Fsync() == 0, "fsync failed: {}", fd->StrError());
  return {};
}

}  // namespace bootdisk
