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

#include "common/libs/fs/shared_fd.h"

namespace bootdisk {

/**
 * Reads from fd until it is closed or errors, storing all data in buf.
 *
 * On a successful read, returns the number of bytes read.
 *
 * If a read error is encountered, returns -1. buf will contain any data read
 * up until that point and errno will be set.
 */
ssize_t ReadAll(SharedFD fd, std::string* buf);

/**
 * Reads exactly `size` bytes at absolute position `offset`.
 *
 * Returns the number of bytes read, which is short only on end of file, or
 * -1 with errno set.
 */
ssize_t PReadExact(SharedFD fd, char* buf, size_t size, off_t offset);

/**
 * Writes exactly `size` bytes at absolute position `offset`.
 *
 * Returns `size` on success, or -1 with errno set.
 */
ssize_t PWriteAll(SharedFD fd, const char* buf, size_t size, off_t offset);

/**
 * Writes to fd until writing all bytes in buf.
 *
 * On a successful write, returns buf.size().
 *
 * If a write error is encountered, returns -1. Some data may have already been
 * written to fd at that point.
 */
ssize_t WriteAll(SharedFD fd, const std::string& buf);
ssize_t WriteAll(SharedFD fd, const char* buf, size_t size);

template <typename T>
ssize_t PReadExactBinary(SharedFD fd, T* binary_data, off_t offset) {
  return PReadExact(fd, (char*)binary_data, sizeof(*binary_data), offset);
}

template <typename T>
ssize_t PWriteAllBinary(SharedFD fd, const T* binary_data, off_t offset) {
  return PWriteAll(fd, (const char*)binary_data, sizeof(*binary_data), offset);
}

}  // namespace bootdisk
