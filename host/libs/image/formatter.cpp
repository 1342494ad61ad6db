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

#include "host/libs/image/formatter.h"

#include <cstdint>
#include <string>

#include <android-base/logging.h>
#include <fmt/format.h>

#include "common/libs/utils/size_utils.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/image/image_spec.h"

namespace bootdisk {

int SectorsPerClusterForCapacity(uint64_t capacity_bytes) {
  if (capacity_bytes <= MiBToBytes(260)) {
    return 1;
  } else if (capacity_bytes <= MiBToBytes(8 * 1024)) {
    return 8;
  } else if (capacity_bytes <= MiBToBytes(16 * 1024)) {
    return 16;
  } else if (capacity_bytes <= MiBToBytes(32 * 1024)) {
    return 32;
  }
  return 64;
}

Result<void> ValidateVolumeLabel(const std::string& label) {
  BD_EXPECT(!label.empty(), "The volume label is empty");
  BD_EXPECTF(label.size() <= 11, "Volume label \"{}\" is longer than 11 "
             "characters", label);
  static constexpr char kForbidden[] = "\"*+,./:;<=>?[\\]|";
  for (char c : label) {
    BD_EXPECTF(c >= 0x20 && c < 0x7f, "Volume label \"{}\" is not printable "
               "ASCII", label);
    BD_EXPECTF(std::string(kForbidden).find(c) == std::string::npos,
               "Volume label \"{}\" contains '{}'", label, c);
    BD_EXPECTF(!(c >= 'a' && c <= 'z'), "Volume label \"{}\" is not upper "
               "case", label);
  }
  return {};
}

Result<void> MkfsFatFormatter::CheckAvailable() const {
  BD_EXPECT(FindExecutable("mkfs.fat"));
  return {};
}

Result<void> MkfsFatFormatter::Format(const BlockDeviceHandle& device,
                                      const FormatOptions& options) {
  BD_EXPECTF(options.partition_size_bytes >= kMinFat32Bytes,
             "A {} byte partition is too small for FAT32 (minimum {} bytes)",
             options.partition_size_bytes, kMinFat32Bytes);
  BD_EXPECT(ValidateVolumeLabel(options.volume_label));

  const int cluster_sectors =
      SectorsPerClusterForCapacity(options.partition_size_bytes);
  Command mkfs("mkfs.fat");
  mkfs.AddParameter("-F");
  mkfs.AddParameter("32");
  mkfs.AddParameter("-s");
  mkfs.AddParameter(cluster_sectors);
  mkfs.AddParameter("-i");
  mkfs.AddParameter(fmt::format("{:08X}", options.volume_id));
  mkfs.AddParameter("-n");
  mkfs.AddParameter(options.volume_label);
  mkfs.AddParameter(device.partition_device());
  LOG(DEBUG) << "Formatting " << device.partition_device() << " as FAT32 with "
             << cluster_sectors << " sector(s) per cluster";
  BD_EXPECT(RunAndCaptureStdout(std::move(mkfs)));
  return {};
}

}  // namespace bootdisk
