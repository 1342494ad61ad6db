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

#include "host/libs/image/interrupt.h"

#include <signal.h>
#include <string.h>

#include <vector>

#include <android-base/logging.h>

#include "common/libs/utils/signals.h"

namespace bootdisk {
namespace {

volatile sig_atomic_t pending_signal = 0;

void RecordSignal(int signal) { pending_signal = signal; }

const std::vector<int> kInterruptSignals = {SIGINT, SIGTERM, SIGHUP};

}  // namespace

InterruptMonitor::InterruptMonitor() {
  ResetInterrupt();
  ChangeSignalHandlers(RecordSignal, kInterruptSignals);
}

InterruptMonitor::~InterruptMonitor() {
  ChangeSignalHandlers(SIG_DFL, kInterruptSignals);
}

int PendingInterrupt() { return pending_signal; }

void ResetInterrupt() { pending_signal = 0; }

Result<void> CheckNotInterrupted() {
  int signal = pending_signal;
  BD_EXPECTF(signal == 0, "Interrupted by signal {} ({})", signal,
             strsignal(signal));
  return {};
}

}  // namespace bootdisk
