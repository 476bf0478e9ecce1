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

#pragma once

#include <stdint.h>

#include <functional>

#include "tiercopy/copy/cancellation_signal.h"
#include "tiercopy/copy/executor.h"
#include "tiercopy/result/result.h"

namespace tiercopy {

// Bytes transferred between two cancellation checks / progress reports.
inline constexpr uint64_t kCheckpointBytes = 524288;

// Receives the cumulative number of bytes copied so far.
using ProgressListener = std::function<void(uint64_t)>;

/**
 * Byte accounting shared by every copy strategy.
 *
 * Each strategy reports the size of every chunk it moved through Advance().
 * Once at least kCheckpointBytes accumulated since the previous checkpoint,
 * the cancellation signal is polled and a progress report is handed to the
 * executor. Finish() reports the final total unconditionally.
 *
 * Progress reports are only scheduled when both an executor and a listener
 * are present, and the listener never runs on the calling thread's stack.
 */
class CheckpointController {
 public:
  CheckpointController(const CancellationSignal* signal, Executor* executor,
                       ProgressListener listener);

  // Accounts `bytes` and returns the cancellation error if a checkpoint was
  // reached after the signal was raised. The bytes stay accounted either way.
  Result<void> Advance(uint64_t bytes);
  void Finish();

  uint64_t Progress() const { return progress_; }
  uint64_t SinceCheckpoint() const { return checkpoint_; }
  // Strategies size their chunks with this so no chunk crosses a checkpoint.
  uint64_t UntilCheckpoint() const { return kCheckpointBytes - checkpoint_; }

 private:
  void Notify();

  const CancellationSignal* signal_;
  Executor* executor_;
  ProgressListener listener_;
  uint64_t progress_ = 0;
  uint64_t checkpoint_ = 0;
};

}  // namespace tiercopy
