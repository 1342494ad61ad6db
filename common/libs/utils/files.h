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

#include <sys/stat.h>
#include <sys/types.h>

#include <chrono>
#include <string>
#include <vector>

#include "common/libs/utils/result.h"

namespace bootdisk {

bool FileExists(const std::string& path, bool follow_symlinks = true);
bool DirectoryExists(const std::string& path, bool follow_symlinks = true);
off_t FileSize(const std::string& path);

// Entries of `path` without "." and "..", sorted by name so that callers
// walk trees in a reproducible order.
Result<std::vector<std::string>> DirectoryContents(const std::string& path);

Result<void> EnsureDirectoryExists(const std::string& directory_path,
                                   mode_t mode = S_IRWXU | S_IRWXG | S_IROTH |
                                                 S_IXOTH);
// mkdtemp(3) of `<parent>/<prefix>XXXXXX`.
Result<std::string> CreateTempDirectory(const std::string& parent,
                                        const std::string& prefix);
// rmdir(2): never descends, so it cannot delete the contents of a filesystem
// that is unexpectedly still mounted on `path`.
Result<void> RemoveEmptyDirectory(const std::string& path);
bool RecursivelyRemoveDirectory(const std::string& path);

// Whether another filesystem is mounted on `path`.
Result<bool> IsMountPoint(const std::string& path);

// Copies the contents of a regular file, creating or truncating `to`.
// Returns the number of bytes copied.
Result<off_t> Copy(const std::string& from, const std::string& to);

Result<std::string> RenameFile(const std::string& current_filepath,
                               const std::string& target_filepath);
bool RemoveFile(const std::string& file);

std::string AbsolutePath(const std::string& path);
std::string CurrentDirectory();

// Polls until `path` exists or `timeout` elapses.
Result<void> WaitForFile(const std::string& path,
                         std::chrono::milliseconds timeout);

}  // namespace bootdisk
