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

#include "common/libs/utils/result.h"

namespace bootdisk {

// Creates, or truncates and overwrites, `path` as a file of exactly
// `size_bytes` zero bytes. The blocks are reserved immediately so that a
// filesystem without room for the image fails here.
Result<void> AllocateImage(const std::string& path, uint64_t size_bytes);

}  // namespace bootdisk
