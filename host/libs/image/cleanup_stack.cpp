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

#include "host/libs/image/cleanup_stack.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>

namespace bootdisk {

CleanupStack::~CleanupStack() {
  if (entries_.empty()) {
    return;
  }
  auto unwound = Unwind();
  if (!unwound.ok()) {
    LOG(ERROR) << "Cleanup on scope exit failed: "
               << unwound.error().Message();
  }
}

void CleanupStack::Push(std::string name, Release release) {
  LOG(VERBOSE) << "Registered release of " << name;
  entries_.push_back(Entry{std::move(name), std::move(release)});
}

Result<void> CleanupStack::Pop(const std::string& name) {
  BD_EXPECTF(!entries_.empty(), "Nothing to release, expected \"{}\"", name);
  BD_EXPECTF(entries_.back().name == name,
             "Out of order release: \"{}\" requested but \"{}\" is the most "
             "recent acquisition",
             name, entries_.back().name);
  auto entry = std::move(entries_.back());
  entries_.pop_back();
  LOG(DEBUG) << "Releasing " << entry.name;
  BD_EXPECTF(entry.release(), "Failed to release {}", entry.name);
  return {};
}

Result<void> CleanupStack::Dismiss(const std::string& name) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&name](const Entry& e) { return e.name == name; });
  BD_EXPECTF(it != entries_.end(), "No release registered for \"{}\"", name);
  entries_.erase(it);
  return {};
}

Result<void> CleanupStack::Unwind() {
  std::vector<std::string> failures;
  while (!entries_.empty()) {
    auto entry = std::move(entries_.back());
    entries_.pop_back();
    LOG(DEBUG) << "Releasing " << entry.name;
    auto released = entry.release();
    if (!released.ok()) {
      LOG(ERROR) << "Failed to release " << entry.name << ": "
                 << released.error().Message();
      LOG(DEBUG) << released.error().Trace();
      failures.push_back(entry.name + " (" + released.error().Message() + ")");
    }
  }
  BD_EXPECTF(failures.empty(), "Could not release: {}",
             android::base::Join(failures, ", "));
  return {};
}

std::vector<std::string> CleanupStack::Names() const {
  std::vector<std::string> names;
  for (const auto& entry : entries_) {
    names.push_back(entry.name);
  }
  return names;
}

}  // namespace bootdisk
