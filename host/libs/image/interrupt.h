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

#include "common/libs/utils/result.h"

namespace bootdisk {

/**
 * Turns SIGINT, SIGTERM and SIGHUP into a request to stop, for as long as
 * the object lives.
 *
 * The handler only records the signal. Long running work polls
 * CheckNotInterrupted() at safe points and unwinds normally, so whatever it
 * acquired is released before the process exits.
 */
class InterruptMonitor {
 public:
  InterruptMonitor();
  InterruptMonitor(const InterruptMonitor&) = delete;
  InterruptMonitor& operator=(const InterruptMonitor&) = delete;
  ~InterruptMonitor();
};

// The signal received since the last reset, or 0.
int PendingInterrupt();
void ResetInterrupt();

// Fails once a signal has been recorded.
Result<void> CheckNotInterrupted();

}  // namespace bootdisk
