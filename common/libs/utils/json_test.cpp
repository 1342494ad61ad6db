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

#include <cstdint>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/json.h"
#include "common/libs/utils/result_matchers.h"

namespace bootdisk {

using testing::HasSubstr;

TEST(JsonTest, GetValueTraversesObjects) {
  auto root = ParseJson(R"({"image": {"size_mb": 64, "label": "BOOT"}})");
  ASSERT_THAT(root, IsOk());

  EXPECT_THAT(GetValue<std::uint64_t>(*root, {"image", "size_mb"}),
              IsOkAndValue(64));
  EXPECT_THAT(GetValue<std::string>(*root, {"image", "label"}),
              IsOkAndValue("BOOT"));
  EXPECT_TRUE(HasValue(*root, {"image", "label"}));
  EXPECT_FALSE(HasValue(*root, {"image", "missing"}));
}

TEST(JsonTest, GetValueRejectsWrongType) {
  auto root = ParseJson(R"({"size_mb": "sixty four", "neg": -1})");
  ASSERT_THAT(root, IsOk());

  EXPECT_THAT(GetValue<std::uint64_t>(*root, {"size_mb"}),
              IsErrorAndMessage(HasSubstr("size_mb")));
  EXPECT_THAT(GetValue<std::uint64_t>(*root, {"neg"}), IsError());
  EXPECT_THAT(GetValue<bool>(*root, {"missing"}), IsError());
}

TEST(JsonTest, GetStringArray) {
  auto root = ParseJson(R"({"artifacts": ["kernel.bin", "boot/limine/"]})");
  ASSERT_THAT(root, IsOk());

  EXPECT_THAT(GetValue<std::vector<std::string>>(*root, {"artifacts"}),
              IsOkAndValue(testing::ElementsAre("kernel.bin", "boot/limine/")));
}

TEST(JsonTest, ParseJsonRejectsGarbage) {
  EXPECT_THAT(ParseJson("{ not json"), IsError());
}

TEST(JsonTest, WriteThenLoadFile) {
  TemporaryDir dir;
  const std::string path = std::string(dir.path) + "/report.json";
  Json::Value value;
  value["image"] = "/tmp/disk.img";
  value["size_bytes"] = Json::UInt64(67108864);

  ASSERT_THAT(WriteJsonFile(path, value), IsOk());
  auto loaded = LoadFromFile(path);

  ASSERT_THAT(loaded, IsOk());
  EXPECT_EQ(*loaded, value);
}

TEST(JsonTest, LoadFromMissingFileFails) {
  EXPECT_THAT(LoadFromFile("/nonexistent/bootdisk.json"), IsError());
}

}  // namespace bootdisk
