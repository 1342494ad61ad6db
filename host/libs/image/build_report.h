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

#include <chrono>
#include <cstdint>
#include <string>

#include <json/json.h>

#include "common/libs/utils/result.h"
#include "host/libs/image/content_stager.h"

namespace bootdisk {

struct BuildReport {
  std::string image;
  uint64_t size_bytes = 0;
  uint64_t partition_first_lba = 0;
  uint64_t partition_sectors = 0;
  uint8_t partition_type = 0;
  bool bootable = false;
  std::string device;
  std::string partitioner;
  std::string binder;
  std::string formatter;
  std::string bootloader_installer;
  StagingReport staging;
  std::chrono::milliseconds elapsed{0};
};

Json::Value ToJson(const BuildReport& report);

Result<void> WriteBuildReport(const std::string& path,
                              const BuildReport& report);

}  // namespace bootdisk
