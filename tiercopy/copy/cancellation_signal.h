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

#include <atomic>

#include "tiercopy/result/result.h"

namespace tiercopy {

/**
 * Cooperative cancellation flag shared between the thread that wants a copy
 * to stop and the thread running it.
 *
 * Raising the signal does not interrupt anything by itself. Long running
 * operations poll it at convenient points through CheckNotCanceled().
 */
class CancellationSignal {
 public:
  CancellationSignal() = default;
  CancellationSignal(const CancellationSignal&) = delete;
  CancellationSignal& operator=(const CancellationSignal&) = delete;

  // Safe to call from any thread, including signal handlers.
  void Cancel();
  bool IsCanceled() const;

  // Returns an error with the ECANCELED error code once Cancel() was called.
  Result<void> CheckNotCanceled() const;

 private:
  std::atomic<bool> canceled_{false};
};

}  // namespace tiercopy
