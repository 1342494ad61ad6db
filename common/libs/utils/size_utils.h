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

#include <stdint.h>

namespace bootdisk {

constexpr uint64_t kSectorSize = 512;
constexpr uint64_t kMiB = 1 << 20;

// Rounds `value` up to the next multiple of `alignment`, which must be a
// power of two.
uint64_t AlignUp(uint64_t value, uint64_t alignment);
uint64_t AlignDown(uint64_t value, uint64_t alignment);
bool IsAligned(uint64_t value, uint64_t alignment);

constexpr uint64_t MiBToBytes(uint64_t mb) { return mb * kMiB; }

}  // namespace bootdisk
