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

#include <stddef.h>
#include <stdint.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "tiercopy/fs/shared_fd.h"
#include "tiercopy/result/result.h"

namespace tiercopy {

/**
 * Exposes an in-memory buffer as one end of a real pipe.
 *
 * A source pipe feeds its buffer into the pipe from a background thread, Fd()
 * is the read end. A sink pipe drains exactly Data().size() bytes from the
 * pipe into its buffer, Fd() is the write end. Either can be handed to Copy()
 * like any other pipe.
 *
 * The background thread is best effort: I/O errors end it quietly. It exits
 * once the buffer is exhausted or the caller closes Fd(). The destructor
 * closes Fd() and joins the thread.
 */
class MemoryPipe {
 public:
  // How long a sink keeps its read end open after draining the buffer.
  static constexpr std::chrono::seconds kSinkLinger{1};

  static Result<std::unique_ptr<MemoryPipe>> CreateSource(
      std::vector<char> data);
  static Result<std::unique_ptr<MemoryPipe>> CreateSink(size_t length);
  // Drains into `buffer`, which must already have the expected size.
  static Result<std::unique_ptr<MemoryPipe>> CreateSink(
      std::vector<char> buffer);

  MemoryPipe(const MemoryPipe&) = delete;
  MemoryPipe& operator=(const MemoryPipe&) = delete;
  ~MemoryPipe();

  // The caller-facing end of the pipe.
  const SharedFD& Fd() const { return exposed_; }
  // The end used by the background thread.
  const SharedFD& InternalFd() const { return internal_; }

  // Closes Fd() without waiting for the background thread.
  void Close();
  // Waits for the background thread to exit.
  void Join();

  // The buffer. Complete for a sink only after Join() returned.
  const std::vector<char>& Data() const { return data_; }
  // Bytes the background thread moved through the pipe. Final after Join().
  uint64_t Transferred() const { return transferred_; }

 private:
  MemoryPipe(std::vector<char> data, bool sink, SharedFD exposed,
             SharedFD internal);

  void Run();
  void Feed();
  void Drain();

  std::vector<char> data_;
  const bool sink_;
  SharedFD exposed_;
  SharedFD internal_;
  std::atomic<uint64_t> transferred_{0};
  std::mutex mutex_;
  std::condition_variable released_;
  bool closing_ = false;
  std::thread runner_;
};

}  // namespace tiercopy
