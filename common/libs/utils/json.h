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
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <json/json.h>

#include "common/libs/utils/result.h"

namespace bootdisk {

Result<Json::Value> ParseJson(std::string_view input);

Result<Json::Value> LoadFromFile(const std::string& path_to_file);

// Indented, human readable serialization.
std::string SerializeJson(const Json::Value& value);
// Writes `value` to `path`, replacing any existing file.
Result<void> WriteJsonFile(const std::string& path, const Json::Value& value);

template <typename T>
Result<T> As(const Json::Value& v);

template <>
inline Result<std::string> As(const Json::Value& v) {
  BD_EXPECT(v.isString(), "Expected a string");
  return v.asString();
}

template <>
inline Result<bool> As(const Json::Value& v) {
  BD_EXPECT(v.isBool(), "Expected a boolean");
  return v.asBool();
}

template <>
inline Result<std::uint64_t> As(const Json::Value& v) {
  BD_EXPECT(v.isUInt64(), "Expected a non-negative integer");
  return static_cast<std::uint64_t>(v.asUInt64());
}

template <>
inline Result<std::vector<std::string>> As(const Json::Value& v) {
  BD_EXPECT(v.isArray(), "Expected an array of strings");
  std::vector<std::string> ret;
  for (const auto& element : v) {
    ret.emplace_back(BD_EXPECT(As<std::string>(element)));
  }
  return ret;
}

template <typename T>
Result<T> GetValue(const Json::Value& root,
                   const std::vector<std::string>& selectors) {
  const Json::Value* traversal = &root;
  for (const auto& selector : selectors) {
    BD_EXPECTF(traversal->isObject() && traversal->isMember(selector),
               "JSON selector \"{}\" does not exist", selector);
    traversal = &(*traversal)[selector];
  }
  return BD_EXPECTF(As<T>(*traversal), "Bad value at \"{}\"",
                    fmt::join(selectors, "."));
}

inline bool HasValue(const Json::Value& root,
                     const std::vector<std::string>& selectors) {
  const Json::Value* traversal = &root;
  for (const auto& selector : selectors) {
    if (!traversal->isObject() || !traversal->isMember(selector)) {
      return false;
    }
    traversal = &(*traversal)[selector];
  }
  return true;
}

}  // namespace bootdisk
