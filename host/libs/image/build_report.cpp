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

#include "host/libs/image/build_report.h"

#include <string>

#include <fmt/format.h>
#include <json/json.h>

#include "common/libs/utils/json.h"

namespace bootdisk {

Json::Value ToJson(const BuildReport& report) {
  Json::Value json;
  json["image"] = report.image;
  json["size_bytes"] = Json::UInt64(report.size_bytes);
  json["device"] = report.device;

  Json::Value partition;
  partition["first_lba"] = Json::UInt64(report.partition_first_lba);
  partition["sectors"] = Json::UInt64(report.partition_sectors);
  partition["type"] = fmt::format("0x{:02X}", report.partition_type);
  partition["bootable"] = report.bootable;
  json["partition"] = partition;

  Json::Value tools;
  tools["partitioner"] = report.partitioner;
  tools["binder"] = report.binder;
  tools["formatter"] = report.formatter;
  if (!report.bootloader_installer.empty()) {
    tools["bootloader_installer"] = report.bootloader_installer;
  }
  json["tools"] = tools;

  Json::Value staged;
  staged["files"] = Json::UInt64(report.staging.files);
  staged["directories"] = Json::UInt64(report.staging.directories);
  staged["bytes"] = Json::UInt64(report.staging.bytes);
  Json::Value entries(Json::arrayValue);
  for (const auto& entry : report.staging.entries) {
    entries.append(entry);
  }
  staged["entries"] = entries;
  json["staged"] = staged;

  json["elapsed_ms"] = Json::Int64(report.elapsed.count());
  return json;
}

Result<void> WriteBuildReport(const std::string& path,
                              const BuildReport& report) {
  BD_EXPECT(WriteJsonFile(path, ToJson(report)),
            "Failed to write the build report");
  return {};
}

}  // namespace bootdisk
