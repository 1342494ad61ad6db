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

#include "host/libs/image/partitioner.h"

#include <fcntl.h>

#include <cstdint>
#include <memory>
#include <string>

#include <android-base/logging.h>

#include "common/libs/fs/shared_fd.h"
#include "common/libs/utils/files.h"
#include "common/libs/utils/size_utils.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/image/mbr.h"

namespace bootdisk {

Result<void> MbrPartitioner::Partition(const std::string& image,
                                       const ImageSpec& spec) {
  BD_EXPECT(ValidateImageSpec(spec));
  const auto image_size = static_cast<uint64_t>(FileSize(image));
  BD_EXPECTF(image_size == spec.total_size_bytes,
             "\"{}\" is {} bytes, expected {}", image, image_size,
             spec.total_size_bytes);

  auto mbr = MakeSinglePartitionMbr(spec.PartitionFirstLba(),
                                    spec.PartitionSectors(), disk_signature_);
  auto fd = SharedFD::Open(image, O_RDWR);
  BD_EXPECTF(fd->IsOpen(), "Failed to open \"{}\": {}", image, fd->StrError());
  BD_EXPECT(WriteMbr(fd, mbr), "in " << image);
  LOG(DEBUG) << "Wrote partition table: first LBA " << spec.PartitionFirstLba()
             << ", " << spec.PartitionSectors() << " sectors";
  return {};
}

Result<void> PartedPartitioner::CheckAvailable() const {
  BD_EXPECT(FindExecutable("parted"));
  return {};
}

Result<void> PartedPartitioner::Partition(const std::string& image,
                                          const ImageSpec& spec) {
  BD_EXPECT(ValidateImageSpec(spec));
  Command parted("parted");
  parted.AddParameter("-s");
  parted.AddParameter(image);
  parted.AddParameter("mklabel");
  parted.AddParameter("msdos");
  parted.AddParameter("mkpart");
  parted.AddParameter("primary");
  parted.AddParameter("fat32");
  parted.AddParameter(spec.partition_offset_bytes, "B");
  parted.AddParameter("100%");
  parted.AddParameter("set");
  parted.AddParameter("1");
  parted.AddParameter("boot");
  parted.AddParameter("on");
  BD_EXPECT(RunAndCaptureStdout(std::move(parted)));
  return {};
}

Result<std::unique_ptr<Partitioner>> CreatePartitioner(
    const std::string& name, uint32_t disk_signature) {
  if (name == "mbr") {
    return std::make_unique<MbrPartitioner>(disk_signature);
  } else if (name == "parted") {
    return std::make_unique<PartedPartitioner>();
  }
  return BD_ERRF("Unknown partitioner \"{}\", expected mbr or parted", name);
}

Result<void> VerifyPartitionTable(const std::string& image,
                                  const ImageSpec& spec) {
  auto mbr = BD_EXPECT(ReadMbr(image));
  BD_EXPECT(HasBootSignature(mbr), "Missing 0x55AA boot signature");
  BD_EXPECT_EQ(UsedPartitionCount(mbr), 1, "Expected a single partition");
  const auto& entry = mbr.partitions[0];
  BD_EXPECT(entry.partition_type == kMbrTypeFat32Lba ||
                entry.partition_type == kMbrTypeFat32Chs,
            "Partition type " << static_cast<int>(entry.partition_type)
                              << " is not FAT32");
  BD_EXPECT_EQ(static_cast<int>(entry.status), static_cast<int>(kMbrBootable),
               "Partition is not bootable");
  BD_EXPECT_EQ(static_cast<uint64_t>(entry.first_lba),
               spec.PartitionFirstLba());
  BD_EXPECT_EQ(static_cast<uint64_t>(entry.num_sectors),
               spec.PartitionSectors());
  return {};
}

}  // namespace bootdisk
