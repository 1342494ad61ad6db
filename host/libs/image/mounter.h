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

#include "common/libs/utils/result.h"

namespace bootdisk {

// A filesystem attached at a directory. Move-only; returned to the Mounter
// that produced it to be unmounted.
class MountHandle {
 public:
  MountHandle(std::string device, std::string mount_point)
      : device_(std::move(device)), mount_point_(std::move(mount_point)) {}
  MountHandle(MountHandle&&) = default;
  MountHandle& operator=(MountHandle&&) = default;
  MountHandle(const MountHandle&) = delete;
  MountHandle& operator=(const MountHandle&) = delete;

  const std::string& device() const { return device_; }
  const std::string& mount_point() const { return mount_point_; }

 private:
  std::string device_;
  std::string mount_point_;
};

class Mounter {
 public:
  virtual ~Mounter() = default;

  virtual Result<void> CheckAvailable() const { return {}; }
  virtual Result<MountHandle> Mount(const std::string& device,
                                    const std::string& mount_point) = 0;
  // Writes back everything copied under the mount point, so what is read
  // afterwards is what the filesystem actually holds.
  virtual Result<void> Flush(const MountHandle&) { return {}; }
  virtual Result<void> Unmount(MountHandle handle) = 0;
};

// mount(2) and umount2(2) of a vfat filesystem.
class VfatMounter : public Mounter {
 public:
  Result<void> CheckAvailable() const override;
  Result<MountHandle> Mount(const std::string& device,
                            const std::string& mount_point) override;
  Result<void> Flush(const MountHandle& handle) override;
  Result<void> Unmount(MountHandle handle) override;
};

}  // namespace bootdisk
