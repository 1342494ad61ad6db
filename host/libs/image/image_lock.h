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

#include <string>
#include <utility>

#include "common/libs/fs/shared_fd.h"
#include "common/libs/utils/result.h"

namespace bootdisk {

/**
 * Exclusive, advisory ownership of an image path between concurrent builds.
 *
 * Backed by flock(2) on "<image>.lock", so it disappears with the process
 * however it exits. The lock file itself is left in place: deleting it would
 * let a third build lock a fresh inode while the second still waits on the
 * old one.
 */
class ImageLock {
 public:
  // Fails immediately, without waiting, if another process holds the lock.
  static Result<ImageLock> Acquire(const std::string& image_path);

  ImageLock(ImageLock&&) = default;
  ImageLock& operator=(ImageLock&&) = default;

  const std::string& path() const { return lock_path_; }

 private:
  ImageLock(std::string lock_path, SharedFD fd)
      : lock_path_(std::move(lock_path)), fd_(std::move(fd)) {}

  std::string lock_path_;
  SharedFD fd_;
};

std::string LockPathForImage(const std::string& image_path);

}  // namespace bootdisk
