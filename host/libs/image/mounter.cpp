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

#include "host/libs/image/mounter.h"

#include <fcntl.h>
#include <string.h>
#include <sys/mount.h>
#include <unistd.h>

#include <cerrno>
#include <string>

#include <android-base/logging.h>

#include "common/libs/fs/shared_fd.h"

namespace bootdisk {

Result<void> VfatMounter::CheckAvailable() const {
  BD_EXPECT(geteuid() == 0, "Mounting a filesystem requires root");
  return {};
}

Result<MountHandle> VfatMounter::Mount(const std::string& device,
                                       const std::string& mount_point) {
  if (mount(device.c_str(), mount_point.c_str(), "vfat", MS_NOSUID | MS_NODEV,
            "utf8,shortname=mixed") != 0) {
    return BD_ERRNO("mount -t vfat " << device << " " << mount_point
                                     << " failed: " << strerror(errno));
  }
  LOG(DEBUG) << "Mounted " << device << " at " << mount_point;
  return MountHandle(device, mount_point);
}

Result<void> VfatMounter::Flush(const MountHandle& handle) {
  auto dir = SharedFD::Open(handle.mount_point(), O_RDONLY | O_DIRECTORY);
  BD_EXPECTF(dir->IsOpen(), "Failed to open \"{}\": {}", handle.mount_point(),
             dir->StrError());
  BD_EXPECTF(dir->Syncfs() == 0, "Failed to flush \"{}\": {}",
             handle.mount_point(), dir->StrError());
  return {};
}

Result<void> VfatMounter::Unmount(MountHandle handle) {
  // Flush the copied data before the filesystem goes away, so a failure to
  // write it back is reported here rather than lost.
  sync();
  if (umount2(handle.mount_point().c_str(), 0) != 0) {
    return BD_ERRNO("umount " << handle.mount_point()
                              << " failed: " << strerror(errno));
  }
  LOG(DEBUG) << "Unmounted " << handle.mount_point();
  return {};
}

}  // namespace bootdisk
