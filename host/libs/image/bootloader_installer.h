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

// Writes boot code into a finished image that is no longer attached.
class BootloaderInstaller {
 public:
  virtual ~BootloaderInstaller() = default;

  virtual std::string Name() const = 0;
  virtual Result<void> CheckAvailable() const { return {}; }
  virtual Result<void> Install(const std::string& image) = 0;
};

// Runs `<tool> bios-install <image>` with the Limine host utility.
class LimineInstaller : public BootloaderInstaller {
 public:
  explicit LimineInstaller(std::string tool) : tool_(std::move(tool)) {}

  std::string Name() const override { return tool_; }
  Result<void> CheckAvailable() const override;
  Result<void> Install(const std::string& image) override;

 private:
  std::string tool_;
};

}  // namespace bootdisk
