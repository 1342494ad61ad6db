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
#include "common/libs/fs/shared_fd.h"

#include <sys/file.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <sstream>

#include <android-base/logging.h>
#include <android-base/macros.h>

namespace bootdisk {

std::shared_ptr<FileInstance> FileInstance::ClosedInstance() {
  return std::shared_ptr<FileInstance>(new FileInstance(-1, EBADF));
}

FileInstance::FileInstance(int fd, int in_errno) : fd_(fd), errno_(in_errno) {
  // Ensure every file descriptor managed by a FileInstance has the CLOEXEC
  // flag
  if (fd_ != -1) {
    TEMP_FAILURE_RETRY(fcntl(fd, F_SETFD, FD_CLOEXEC));
  }
  std::stringstream identity;
  identity << "fd=" << fd;
  identity_ = identity.str();
}

void FileInstance::Close() {
  if (fd_ == -1) {
    errno_ = EBADF;
  } else if (close(fd_) == -1) {
    errno_ = errno;
    LOG(VERBOSE) << "close(" << identity_ << ") failed: " << StrError();
  }
  fd_ = -1;
}

int FileInstance::Fallocate(off_t offset, off_t length) {
  // posix_fallocate returns the error instead of setting errno.
  int ret = posix_fallocate(fd_, offset, length);
  errno_ = ret;
  return ret == 0 ? 0 : -1;
}

int FileInstance::Fcntl(int command, int value) {
  errno = 0;
  int rval = TEMP_FAILURE_RETRY(fcntl(fd_, command, value));
  errno_ = errno;
  return rval;
}

int FileInstance::Fsync() {
  errno = 0;
  int rval = TEMP_FAILURE_RETRY(fsync(fd_));
  errno_ = errno;
  return rval;
}

int FileInstance::Syncfs() {
  errno = 0;
  int rval = TEMP_FAILURE_RETRY(syncfs(fd_));
  errno_ = errno;
  return rval;
}

Result<void> FileInstance::Flock(int operation) {
  errno = 0;
  int rval = TEMP_FAILURE_RETRY(flock(fd_, operation));
  errno_ = errno;
  BD_EXPECTF(rval == 0, "flock({}, {}) failed: {}", identity_, operation,
             StrError());
  return {};
}

int FileInstance::Ioctl(unsigned long request, void* val) {
  errno = 0;
  int rval = TEMP_FAILURE_RETRY(ioctl(fd_, request, val));
  errno_ = errno;
  return rval;
}

ssize_t FileInstance::PRead(void* buf, size_t count, off_t offset) {
  errno = 0;
  ssize_t rval = TEMP_FAILURE_RETRY(pread(fd_, buf, count, offset));
  errno_ = errno;
  return rval;
}

ssize_t FileInstance::PWrite(const void* buf, size_t count, off_t offset) {
  errno = 0;
  ssize_t rval = TEMP_FAILURE_RETRY(pwrite(fd_, buf, count, offset));
  errno_ = errno;
  return rval;
}

ssize_t FileInstance::Read(void* buf, size_t count) {
  errno = 0;
  ssize_t rval = TEMP_FAILURE_RETRY(read(fd_, buf, count));
  errno_ = errno;
  return rval;
}

std::string FileInstance::StrError() const {
  return std::string(strerror(errno_));
}

int FileInstance::Truncate(off_t length) {
  errno = 0;
  int rval = TEMP_FAILURE_RETRY(ftruncate(fd_, length));
  errno_ = errno;
  return rval;
}

ssize_t FileInstance::Write(const void* buf, size_t count) {
  if (count == 0) {
    return 0;
  }
  errno = 0;
  ssize_t rval = TEMP_FAILURE_RETRY(write(fd_, buf, count));
  errno_ = errno;
  return rval;
}

SharedFD SharedFD::ErrorFD(int error) {
  return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(-1, error)));
}

SharedFD SharedFD::Dup(int unmanaged_fd) {
  int fd = fcntl(unmanaged_fd, F_DUPFD_CLOEXEC, 3);
  int error_num = errno;
  return SharedFD(
      std::shared_ptr<FileInstance>(new FileInstance(fd, error_num)));
}

SharedFD SharedFD::Open(const std::string& pathname, int flags, mode_t mode) {
  errno = 0;
  int fd = TEMP_FAILURE_RETRY(open(pathname.c_str(), flags, mode));
  if (fd == -1) {
    return SharedFD::ErrorFD(errno);
  }
  return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(fd, errno)));
}

SharedFD SharedFD::Creat(const std::string& pathname, mode_t mode) {
  return SharedFD::Open(pathname, O_CREAT | O_TRUNC | O_WRONLY, mode);
}

bool SharedFD::Pipe(SharedFD* fd0, SharedFD* fd1) {
  int fds[2];
  int rval = pipe2(fds, O_CLOEXEC);
  if (rval != -1) {
    (*fd0) = std::shared_ptr<FileInstance>(new FileInstance(fds[0], errno));
    (*fd1) = std::shared_ptr<FileInstance>(new FileInstance(fds[1], errno));
    return true;
  }
  return false;
}

}  // namespace bootdisk
