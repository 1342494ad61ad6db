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

#include "host/libs/image/image_lock.h"

#include <fcntl.h>
#include <sys/file.h>

#include <cerrno>
#include <string>

#include <android-base/logging.h>

namespace bootdisk {

std::string LockPathForImage(const std::string& image_path) {
  return image_path + ".lock";
}

Result<ImageLock> ImageLock::Acquire(const std::string& image_path) {
  auto lock_path = LockPathForImage(image_path);
  auto fd = SharedFD::Open(lock_path, O_CREAT | O_RDWR, 0644);
  BD_EXPECTF(fd->IsOpen(), "Failed to open lock file \"{}\": {}", lock_path,
             fd->StrError());
  auto locked = fd->Flock(LOCK_EX | LOCK_NB);
  BD_EXPECTF(locked.ok() || fd->GetErrno() != EWOULDBLOCK,
             "Another build is already writing \"{}\" (holding \"{}\")",
             image_path, lock_path);
  BD_EXPECT(std::move(locked), "Failed to lock " << lock_path);
  LOG(DEBUG) << "Locked " << lock_path;
  return ImageLock(lock_path, fd);
}

}  // namespace bootdisk
