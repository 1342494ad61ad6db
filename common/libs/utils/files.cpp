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

#include "common/libs/utils/files.h"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <limits.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/macros.h>

#include "common/libs/fs/shared_buf.h"
#include "common/libs/fs/shared_fd.h"
#include "common/libs/utils/result.h"

namespace bootdisk {

bool FileExists(const std::string& path, bool follow_symlinks) {
  struct stat st {};
  return (follow_symlinks ? stat : lstat)(path.c_str(), &st) == 0;
}

bool DirectoryExists(const std::string& path, bool follow_symlinks) {
  struct stat st {};
  if ((follow_symlinks ? stat : lstat)(path.c_str(), &st) == -1) {
    return false;
  }
  if ((st.st_mode & S_IFMT) != S_IFDIR) {
    return false;
  }
  return true;
}

off_t FileSize(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) == -1) {
    return 0;
  }
  return st.st_size;
}

Result<std::vector<std::string>> DirectoryContents(const std::string& path) {
  std::vector<std::string> ret;
  std::unique_ptr<DIR, int (*)(DIR*)> dir(opendir(path.c_str()), closedir);
  BD_EXPECTF(dir != nullptr, "Could not read from dir \"{}\": {}", path,
             strerror(errno));
  struct dirent* ent{};
  errno = 0;
  while ((ent = readdir(dir.get()))) {
    std::string name = ent->d_name;
    if (name != "." && name != "..") {
      ret.emplace_back(std::move(name));
    }
  }
  BD_EXPECTF(errno == 0, "readdir(\"{}\") failed: {}", path, strerror(errno));
  std::sort(ret.begin(), ret.end());
  return ret;
}

Result<void> EnsureDirectoryExists(const std::string& directory_path,
                                   const mode_t mode) {
  if (DirectoryExists(directory_path, /* follow_symlinks */ true)) {
    return {};
  }
  const auto parent_dir = android::base::Dirname(directory_path);
  if (parent_dir.size() > 1 && parent_dir != directory_path) {
    BD_EXPECT(EnsureDirectoryExists(parent_dir, mode));
  }
  LOG(VERBOSE) << "Setting up " << directory_path;
  if (mkdir(directory_path.c_str(), mode) < 0 && errno != EEXIST) {
    return BD_ERRNO("Failed to create directory: \"" << directory_path
                                                     << "\": "
                                                     << strerror(errno));
  }
  return {};
}

Result<std::string> CreateTempDirectory(const std::string& parent,
                                        const std::string& prefix) {
  std::string templ = parent + "/" + prefix + "XXXXXX";
  std::vector<char> buffer(templ.begin(), templ.end());
  buffer.push_back('\0');
  BD_EXPECTF(mkdtemp(buffer.data()) != nullptr, "mkdtemp(\"{}\") failed: {}",
             templ, strerror(errno));
  return std::string(buffer.data());
}

Result<void> RemoveEmptyDirectory(const std::string& path) {
  BD_EXPECTF(rmdir(path.c_str()) == 0, "rmdir(\"{}\") failed: {}", path,
             strerror(errno));
  return {};
}

bool RecursivelyRemoveDirectory(const std::string& path) {
  // Copied from libbase TemporaryDir destructor.
  auto callback = [](const char* child, const struct stat*, int file_type,
                     struct FTW*) -> int {
    switch (file_type) {
      case FTW_D:
      case FTW_DP:
      case FTW_DNR:
        if (rmdir(child) == -1) {
          PLOG(ERROR) << "rmdir " << child;
        }
        break;
      case FTW_NS:
      default:
        if (rmdir(child) != -1) {
          break;
        }
        // FALLTHRU (for gcc, lint, pcc, etc; and following for clang)
        FALLTHROUGH_INTENDED;
      case FTW_F:
      case FTW_SL:
      case FTW_SLN:
        if (unlink(child) == -1) {
          PLOG(ERROR) << "unlink " << child;
        }
        break;
    }
    return 0;
  };

  return nftw(path.c_str(), callback, 128, FTW_DEPTH | FTW_MOUNT | FTW_PHYS) ==
         0;
}

Result<bool> IsMountPoint(const std::string& path) {
  struct stat self {};
  BD_EXPECTF(lstat(path.c_str(), &self) == 0, "lstat(\"{}\") failed: {}", path,
             strerror(errno));
  struct stat parent {};
  const auto parent_path = path + "/..";
  BD_EXPECTF(stat(parent_path.c_str(), &parent) == 0,
             "stat(\"{}\") failed: {}", parent_path, strerror(errno));
  if (self.st_dev != parent.st_dev) {
    return true;
  }
  // The root of a filesystem is its own parent.
  return self.st_ino == parent.st_ino;
}

Result<off_t> Copy(const std::string& from, const std::string& to) {
  auto fd_from = SharedFD::Open(from, O_RDONLY);
  BD_EXPECTF(fd_from->IsOpen(), "Could not open \"{}\": {}", from,
             fd_from->StrError());
  auto fd_to = SharedFD::Open(to, O_WRONLY | O_CREAT | O_TRUNC, 0644);
  BD_EXPECTF(fd_to->IsOpen(), "Could not create \"{}\": {}", to,
             fd_to->StrError());

  off_t copied = 0;
  std::vector<char> buffer(1 << 16);
  while (true) {
    ssize_t read = fd_from->Read(buffer.data(), buffer.size());
    BD_EXPECTF(read >= 0, "Failed to read \"{}\": {}", from,
               fd_from->StrError());
    if (read == 0) {
      break;
    }
    BD_EXPECTF(WriteAll(fd_to, buffer.data(), read) == read,
               "Failed to write \"{}\": {}", to, fd_to->StrError());
    copied += read;
  }
  BD_EXPECTF(fd_to->Fsync() == 0, "fsync(\"{}\") failed: {}", to,
             fd_to->StrError());
  return copied;
}

Result<std::string> RenameFile(const std::string& current_filepath,
                               const std::string& target_filepath) {
  if (current_filepath != target_filepath) {
    BD_EXPECT(rename(current_filepath.c_str(), target_filepath.c_str()) == 0,
              "rename " << current_filepath << " to " << target_filepath
                        << " failed: " << strerror(errno));
  }
  return target_filepath;
}

bool RemoveFile(const std::string& file) {
  LOG(DEBUG) << "Removing file " << file;
  return remove(file.c_str()) == 0;
}

std::string AbsolutePath(const std::string& path) {
  if (path.empty()) {
    return {};
  }
  if (path[0] == '/') {
    return path;
  }
  if (path[0] == '~') {
    LOG(WARNING) << "Tilde expansion in path " << path << " is not supported";
    return {};
  }

  std::array<char, PATH_MAX> buffer{};
  if (!realpath(".", buffer.data())) {
    LOG(WARNING) << "Could not get real path for current directory \".\""
                 << ": " << strerror(errno);
    return {};
  }
  return std::string{buffer.data()} + "/" + path;
}

std::string CurrentDirectory() {
  std::unique_ptr<char, void (*)(void*)> cwd(getcwd(nullptr, 0), &free);
  if (!cwd) {
    PLOG(ERROR) << "`getcwd(nullptr, 0)` failed";
    return "";
  }
  return std::string(cwd.get());
}

Result<void> WaitForFile(const std::string& path,
                         std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!FileExists(path)) {
    BD_EXPECTF(std::chrono::steady_clock::now() < deadline,
               "\"{}\" did not appear within {}ms", path, timeout.count());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  return {};
}

}  // namespace bootdisk
