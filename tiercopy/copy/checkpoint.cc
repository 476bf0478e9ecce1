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

#include "tiercopy/copy/checkpoint.h"

#include <stdint.h>

#include <utility>

#include "tiercopy/copy/cancellation_signal.h"
#include "tiercopy/copy/executor.h"
#include "tiercopy/result/result.h"

namespace tiercopy {

CheckpointController::CheckpointController(const CancellationSignal* signal,
                                           Executor* executor,
                                           ProgressListener listener)
    : signal_(signal), executor_(executor), listener_(std::move(listener)) {}

Result<void> CheckpointController::Advance(uint64_t bytes) {
  progress_ += bytes;
  checkpoint_ += bytes;
  if (checkpoint_ < kCheckpointBytes) {
    return {};
  }
  if (signal_) {
    TC_EXPECT(signal_->CheckNotCanceled(),
              "Stopped after " << progress_ << " bytes");
  }
  Notify();
  checkpoint_ = 0;
  return {};
}

void CheckpointController::Finish() { Notify(); }

void CheckpointController::Notify() {
  if (!executor_ || !listener_) {
    return;
  }
  executor_->Execute(
      [listener = listener_, progress = progress_]() { listener(progress); });
}

}  // namespace tiercopy
