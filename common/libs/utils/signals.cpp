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

#include "common/libs/utils/signals.h"

#include <string.h>

#include <android-base/logging.h>

namespace bootdisk {

void ChangeSignalHandlers(void (*handler)(int), std::vector<int> signals) {
  struct sigaction act;
  memset(&act, 0, sizeof(act));
  act.sa_handler = handler;
  sigemptyset(&act.sa_mask);
  act.sa_flags = 0;
  for (auto signal : signals) {
    if (sigaction(signal, &act, nullptr) != 0) {
      PLOG(ERROR) << "sigaction(" << signal << ") failed";
    }
  }
}

}  // namespace bootdisk
