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

#include "host/libs/image/bootloader_installer.h"

#include <string>

#include <android-base/logging.h>

#include "common/libs/utils/subprocess.h"

namespace bootdisk {

Result<void> LimineInstaller::CheckAvailable() const {
  BD_EXPECT(FindExecutable(tool_), "The bootloader install tool is missing");
  return {};
}

Result<void> LimineInstaller::Install(const std::string& image) {
  Command install(tool_);
  install.AddParameter("bios-install");
  install.AddParameter(image);
  BD_EXPECT(RunAndCaptureStdout(std::move(install)));
  LOG(DEBUG) << "Installed the Limine BIOS stages into " << image;
  return {};
}

}  // namespace bootdisk
