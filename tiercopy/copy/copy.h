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

#include <string>

#include "tiercopy/copy/cancellation_signal.h"
#include "tiercopy/copy/checkpoint.h"
#include "tiercopy/copy/copier.h"
#include "tiercopy/copy/endpoint.h"
#include "tiercopy/copy/executor.h"
#include "tiercopy/fs/shared_fd.h"
#include "tiercopy/io/io.h"
#include "tiercopy/result/result.h"

namespace tiercopy {

/**
 * Copies the contents of one descriptor to another, starting at the current
 * position of both and advancing them.
 *
 * Attempts to move the data inside the kernel (sendfile(2) between regular
 * files, splice(2) when a pipe is involved) before falling back to a
 * userspace copy as a last resort.
 *
 * `signal` is polled and `listener` is notified, through `executor`, every
 * kCheckpointBytes bytes. The listener is notified once more with the final
 * total when the copy completes. Any of the three may be null.
 *
 * Returns the number of bytes copied. On failure the bytes already copied stay
 * in the destination. A cancellation is reported with the ECANCELED error
 * code, see IsCanceled().
 */
Result<uint64_t> Copy(const SharedFD& in, const SharedFD& out);
Result<uint64_t> Copy(const SharedFD& in, const SharedFD& out,
                      const CancellationSignal* signal, Executor* executor,
                      ProgressListener listener);
// Copies at most `count` bytes; kUnboundedCount copies until the end.
Result<uint64_t> Copy(const SharedFD& in, const SharedFD& out, uint64_t count,
                      const CancellationSignal* signal, Executor* executor,
                      ProgressListener listener);

// Copies between arbitrary streams. Two SharedFdIo streams take the
// descriptor path above while copy optimizations are enabled.
Result<uint64_t> Copy(Reader& in, Writer& out);
Result<uint64_t> Copy(Reader& in, Writer& out,
                      const CancellationSignal* signal, Executor* executor,
                      ProgressListener listener);

// Replaces the contents of `to` with the contents of `from`.
Result<uint64_t> CopyFile(const std::string& from, const std::string& to);
Result<uint64_t> CopyFile(const std::string& from, const std::string& to,
                          const CancellationSignal* signal,
                          Executor* executor, ProgressListener listener);

// Replaces the contents of `to` with the rest of `in`, and flushes `to` to
// stable storage before returning.
Result<uint64_t> CopyToFile(Reader& in, const std::string& to);

// Flushes the data of `fd` to stable storage with fsync(2).
Result<void> Sync(const SharedFD& fd);

// Single strategy entry points. They skip the endpoint classification, so the
// caller is responsible for the descriptor types.
Result<uint64_t> CopyInternalSendfile(const SharedFD& in, const SharedFD& out,
                                      uint64_t count,
                                      const CancellationSignal* signal,
                                      Executor* executor,
                                      ProgressListener listener);
Result<uint64_t> CopyInternalSplice(const SharedFD& in, const SharedFD& out,
                                    uint64_t count,
                                    const CancellationSignal* signal,
                                    Executor* executor,
                                    ProgressListener listener);
Result<uint64_t> CopyInternalUserspace(const SharedFD& in, const SharedFD& out,
                                       uint64_t count,
                                       const CancellationSignal* signal,
                                       Executor* executor,
                                       ProgressListener listener);
Result<uint64_t> CopyInternalUserspace(Reader& in, Writer& out,
                                       const CancellationSignal* signal,
                                       Executor* executor,
                                       ProgressListener listener);

}  // namespace tiercopy
