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

#include "host/libs/image/image_allocator.h"

#include <fcntl.h>
#include <string.h>

#include <cstdint>
#include <string>

#include <android-base/file.h>
#include <android-base/logging.h>

#include "common/libs/fs/shared_fd.h"
#include "common/libs/utils/files.h"

namespace bootdisk {

Result<void> AllocateImage(const std::string& path, uint64_t size_bytes) {
  LOG(DEBUG) << "Creating " << path << " (" << size_bytes << " bytes)";

  auto parent = android::base::Dirname(path);
  BD_EXPECTF(DirectoryExists(parent), "Directory \"{}\" does not exist",
             parent);

  auto fd = SharedFD::Open(path, O_CREAT | O_TRUNC | O_RDWR, 0644);
  BD_EXPECTF(fd->IsOpen(), "Failed to create \"{}\": {}", path,
             fd->StrError());
  // Truncating to zero first discards the old contents, so every byte of the
  // new length reads back as zero.
  BD_EXPECTF(fd->Truncate(size_bytes) == 0, "`truncate --size={} {}` failed: {}",
             size_bytes, path, fd->StrError());
  if (fd->Fallocate(0, size_bytes) != 0) {
    auto error = fd->StrError();
    RemoveFile(path);
    return BD_ERRF("Could not reserve {} bytes for \"{}\": {}", size_bytes,
                   path, error);
  }
  BD_EXPECTF(fd->Fsync() == 0, "fsync(\"{}\") failed: {}", path,
             fd->StrError());
  return {};
}

}  // namespace bootdisk
