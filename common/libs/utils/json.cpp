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

#include "common/libs/utils/json.h"

#include <fcntl.h>

#include <memory>
#include <string>
#include <string_view>

#include <json/json.h>

#include "common/libs/fs/shared_buf.h"
#include "common/libs/fs/shared_fd.h"

namespace bootdisk {

Result<Json::Value> ParseJson(std::string_view input) {
  Json::Value root;
  JSONCPP_STRING err;
  Json::CharReaderBuilder builder;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  auto begin = input.data();
  auto end = begin + input.length();
  BD_EXPECT(reader->parse(begin, end, &root, &err), err);
  return root;
}

Result<Json::Value> LoadFromFile(const std::string& path_to_file) {
  auto fd = SharedFD::Open(path_to_file, O_RDONLY);
  BD_EXPECTF(fd->IsOpen(), "Failed to open \"{}\": {}", path_to_file,
             fd->StrError());
  std::string contents;
  BD_EXPECTF(ReadAll(fd, &contents) >= 0, "Failed to read \"{}\": {}",
             path_to_file, fd->StrError());
  return BD_EXPECTF(ParseJson(contents), "\"{}\" is not valid JSON",
                    path_to_file);
}

std::string SerializeJson(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  return Json::writeString(builder, value) + "\n";
}

Result<void> WriteJsonFile(const std::string& path, const Json::Value& value) {
  auto fd = SharedFD::Creat(path, 0644);
  BD_EXPECTF(fd->IsOpen(), "Failed to create \"{}\": {}", path,
             fd->StrError());
  auto serialized = SerializeJson(value);
  BD_EXPECTF(WriteAll(fd, serialized) == static_cast<ssize_t>(serialized.size()),
             "Failed to write \"{}\": {}", path, fd->StrError());
  return {};
}

}  // namespace bootdisk
