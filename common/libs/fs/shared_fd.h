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

#include <memory>
#include <string>

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include "common/libs/utils/result.h"

/**
 * Reference counted file descriptors.
 *
 * o Files are auto-closed when the last reference goes out of scope.
 * o It is impossible to close the same instance twice.
 * o Descriptors are always initialized. By default a SharedFD refers to a
 *   closed instance, so every method call is safe (null object pattern).
 *
 * The methods mirror the POSIX calls they wrap. Errors on calls that create
 * a new FileInstance, such as Open, are reported with a closed instance whose
 * errno is set; every other call stores errno in the instance so it can be
 * read back with GetErrno() or StrError() after the fact.
 */
namespace bootdisk {

class FileInstance;

class SharedFD {
 public:
  inline SharedFD();
  SharedFD(const std::shared_ptr<FileInstance>& in) : value_(in) {}
  SharedFD(const SharedFD&) = default;
  SharedFD(SharedFD&& other) = default;
  SharedFD& operator=(const SharedFD&) = default;
  SharedFD& operator=(SharedFD&& other) = default;

  static SharedFD Dup(int unmanaged_fd);
  static SharedFD Open(const std::string& pathname, int flags, mode_t mode = 0);
  static SharedFD Creat(const std::string& pathname, mode_t mode);
  static bool Pipe(SharedFD* fd0, SharedFD* fd1);

  bool operator==(const SharedFD& rhs) const { return value_ == rhs.value_; }
  bool operator!=(const SharedFD& rhs) const { return value_ != rhs.value_; }
  bool operator<(const SharedFD& rhs) const { return value_ < rhs.value_; }

  std::shared_ptr<FileInstance> operator->() const { return value_; }
  const FileInstance& operator*() const { return *value_; }
  FileInstance& operator*() { return *value_; }

 private:
  static SharedFD ErrorFD(int error);

  std::shared_ptr<FileInstance> value_;
};

class FileInstance {
  friend class SharedFD;

 public:
  virtual ~FileInstance() { Close(); }

  static std::shared_ptr<FileInstance> ClosedInstance();

  void Close();
  // posix_fallocate(3). Unlike most calls this reports ENOSPC immediately
  // instead of on a later write.
  int Fallocate(off_t offset, off_t length);
  int Fcntl(int command, int value);
  int Fsync();
  Result<void> Flock(int operation);
  int GetErrno() const { return errno_; }
  int Ioctl(unsigned long request, void* val = nullptr);
  bool IsOpen() const { return fd_ != -1; }
  ssize_t PRead(void* buf, size_t count, off_t offset);
  ssize_t PWrite(const void* buf, size_t count, off_t offset);
  ssize_t Read(void* buf, size_t count);
  std::string StrError() const;
  // syncfs(2) of the filesystem holding this file.
  int Syncfs();
  int Truncate(off_t length);
  ssize_t Write(const void* buf, size_t count);

  const std::string& identity() const { return identity_; }

 private:
  FileInstance(int fd, int in_errno);

  int fd_;
  int errno_;
  std::string identity_;
};

SharedFD::SharedFD() : value_(FileInstance::ClosedInstance()) {}

}  // namespace bootdisk
