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

#include <chrono>
#include <memory>
#include <string>

#include "common/libs/utils/result.h"

namespace bootdisk {

/**
 * Ownership of a backing file attached as a block device.
 *
 * Move-only; the binder that produced it takes it back in Detach(), so each
 * attachment is released exactly once.
 */
class BlockDeviceHandle {
 public:
  BlockDeviceHandle(std::string device, std::string partition_device,
                    std::string backing_file)
      : device_(std::move(device)),
        partition_device_(std::move(partition_device)),
        backing_file_(std::move(backing_file)) {}
  BlockDeviceHandle(BlockDeviceHandle&&) = default;
  BlockDeviceHandle& operator=(BlockDeviceHandle&&) = default;
  BlockDeviceHandle(const BlockDeviceHandle&) = delete;
  BlockDeviceHandle& operator=(const BlockDeviceHandle&) = delete;

  // Whole device node, e.g. /dev/loop3
  const std::string& device() const { return device_; }
  // Node of the first partition, e.g. /dev/loop3p1
  const std::string& partition_device() const { return partition_device_; }
  const std::string& backing_file() const { return backing_file_; }

 private:
  std::string device_;
  std::string partition_device_;
  std::string backing_file_;
};

// Partition node of a whole device node: /dev/loop3 -> /dev/loop3p1.
std::string PartitionDeviceName(const std::string& device, int partition);

class DeviceBinder {
 public:
  virtual ~DeviceBinder() = default;

  virtual std::string Name() const = 0;
  virtual Result<void> CheckAvailable() const { return {}; }
  // Attaches `image` with partition scanning and waits for the node of its
  // first partition.
  virtual Result<BlockDeviceHandle> Bind(const std::string& image) = 0;
  virtual Result<void> Detach(BlockDeviceHandle handle) = 0;
};

// Uses losetup(8).
class LosetupBinder : public DeviceBinder {
 public:
  std::string Name() const override { return "losetup"; }
  Result<void> CheckAvailable() const override;
  Result<BlockDeviceHandle> Bind(const std::string& image) override;
  Result<void> Detach(BlockDeviceHandle handle) override;
};

// Talks to /dev/loop-control and the loop driver directly.
class LoopControlBinder : public DeviceBinder {
 public:
  std::string Name() const override { return "loop-control"; }
  Result<void> CheckAvailable() const override;
  Result<BlockDeviceHandle> Bind(const std::string& image) override;
  Result<void> Detach(BlockDeviceHandle handle) override;
};

Result<std::unique_ptr<DeviceBinder>> CreateDeviceBinder(
    const std::string& name);

// How long a binder waits for the kernel to create the partition node.
constexpr std::chrono::seconds kPartitionNodeTimeout(10);

}  // namespace bootdisk
