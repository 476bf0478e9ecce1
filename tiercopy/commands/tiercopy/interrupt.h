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

#include "tiercopy/copy/cancellation_signal.h"
#include "tiercopy/result/result.h"

namespace tiercopy {

/**
 * Makes the first SIGINT raise `signal` and restores the default action, so a
 * second SIGINT terminates the process. The copy loop only polls `signal` at
 * checkpoints, and a stalled read never reaches one.
 *
 * `signal` must outlive the process, or at least any SIGINT.
 */
Result<void> CancelOnInterrupt(CancellationSignal& signal);

}  // namespace tiercopy
