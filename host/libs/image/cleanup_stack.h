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

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "common/libs/utils/result.h"

namespace bootdisk {

/**
 * Releases registered at acquisition time, run in reverse order.
 *
 * Every resource a build acquires pushes its release here. The build either
 * releases the resources itself in order (Pop) or hands them back (Dismiss),
 * and on failure unwinds whatever is left. Entries still present when the
 * stack is destroyed are unwound then, with failures logged.
 */
class CleanupStack {
 public:
  using Release = std::function<Result<void>()>;

  CleanupStack() = default;
  CleanupStack(const CleanupStack&) = delete;
  CleanupStack& operator=(const CleanupStack&) = delete;
  ~CleanupStack();

  void Push(std::string name, Release release);

  // Runs the most recent release, which must be called `name`.
  Result<void> Pop(const std::string& name);
  // Forgets the release called `name` without running it.
  Result<void> Dismiss(const std::string& name);

  // Runs every remaining release, most recent first. All of them run even if
  // some fail; the failures are reported together.
  Result<void> Unwind();

  bool Empty() const { return entries_.empty(); }
  std::vector<std::string> Names() const;

 private:
  struct Entry {
    std::string name;
    Release release;
  };
  std::vector<Entry> entries_;
};

}  // namespace bootdisk
