//
// Copyright (C) 2026 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "tiercopy/commands/tiercopy/interrupt.h"

#include <signal.h>
#include <unistd.h>

#include <atomic>

#include "tiercopy/copy/cancellation_signal.h"
#include "tiercopy/result/result.h"

namespace tiercopy {
namespace {

std::atomic<CancellationSignal*> interrupt_target{nullptr};

constexpr char kInterruptMessage[] =
    "Interrupted, stopping at the next checkpoint. Interrupt again to abort.\n";

void OnInterrupt(int) {
  CancellationSignal* signal = interrupt_target.load();
  if (signal) {
    signal->Cancel();
  }
  // Only async-signal-safe calls here. The message is best effort.
  ssize_t unused = write(STDERR_FILENO, kInterruptMessage,
                         sizeof(kInterruptMessage) - 1);
  (void)unused;
}

}  // namespace

Result<void> CancelOnInterrupt(CancellationSignal& signal) {
  interrupt_target.store(&signal);
  struct sigaction action = {};
  action.sa_handler = OnInterrupt;
  action.sa_flags = SA_RESETHAND;
  sigemptyset(&action.sa_mask);
  if (sigaction(SIGINT, &action, nullptr) != 0) {
    return TC_ERRNO("Could not install the SIGINT handler");
  }
  return {};
}

}  // namespace tiercopy
