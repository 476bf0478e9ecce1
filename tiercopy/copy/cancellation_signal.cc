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

#include "tiercopy/copy/cancellation_signal.h"

#include <errno.h>

#include "tiercopy/result/result.h"

namespace tiercopy {

void CancellationSignal::Cancel() {
  canceled_.store(true, std::memory_order_release);
}

bool CancellationSignal::IsCanceled() const {
  return canceled_.load(std::memory_order_acquire);
}

Result<void> CancellationSignal::CheckNotCanceled() const {
  if (IsCanceled()) {
    return TC_ERR_CODE(ECANCELED, "Operation canceled");
  }
  return {};
}

}  // namespace tiercopy
