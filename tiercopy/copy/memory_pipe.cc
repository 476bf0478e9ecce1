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

#include "tiercopy/copy/memory_pipe.h"

#include <errno.h>
#include <pthread.h>
#include <signal.h>
#include <string.h>

#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include <android-base/logging.h>

#include "tiercopy/fs/shared_buf.h"
#include "tiercopy/fs/shared_fd.h"
#include "tiercopy/result/result.h"

namespace tiercopy {

Result<std::unique_ptr<MemoryPipe>> MemoryPipe::CreateSource(
    std::vector<char> data) {
  auto [read_end, write_end] =
      TC_EXPECT(SharedFD::Pipe(), "Could not create memory source pipe");
  std::unique_ptr<MemoryPipe> pipe(
      new MemoryPipe(std::move(data), false, read_end, write_end));
  return pipe;
}

Result<std::unique_ptr<MemoryPipe>> MemoryPipe::CreateSink(size_t length) {
  return CreateSink(std::vector<char>(length));
}

Result<std::unique_ptr<MemoryPipe>> MemoryPipe::CreateSink(
    std::vector<char> buffer) {
  auto [read_end, write_end] =
      TC_EXPECT(SharedFD::Pipe(), "Could not create memory sink pipe");
  std::unique_ptr<MemoryPipe> pipe(
      new MemoryPipe(std::move(buffer), true, write_end, read_end));
  return pipe;
}

MemoryPipe::MemoryPipe(std::vector<char> data, bool sink, SharedFD exposed,
                       SharedFD internal)
    : data_(std::move(data)),
      sink_(sink),
      exposed_(std::move(exposed)),
      internal_(std::move(internal)),
      runner_([this]() { Run(); }) {}

MemoryPipe::~MemoryPipe() {
  Close();
  Join();
}

void MemoryPipe::Close() {
  exposed_->Close();
  std::lock_guard lock(mutex_);
  closing_ = true;
  released_.notify_all();
}

void MemoryPipe::Join() {
  if (runner_.joinable()) {
    runner_.join();
  }
}

void MemoryPipe::Run() {
  if (sink_) {
    Drain();
  } else {
    Feed();
  }
  internal_->Close();
}

void MemoryPipe::Feed() {
  // A reader that goes away must end this thread with EPIPE, not the process
  // with SIGPIPE.
  sigset_t sigpipe;
  sigemptyset(&sigpipe);
  sigaddset(&sigpipe, SIGPIPE);
  pthread_sigmask(SIG_BLOCK, &sigpipe, nullptr);

  size_t written = 0;
  if (WriteAll(internal_, data_, &written) < 0) {
    LOG(DEBUG) << "Memory source stopped after " << written
               << " bytes: " << strerror(errno);
  }
  transferred_ = written;
}

void MemoryPipe::Drain() {
  size_t read = 0;
  if (ReadExact(internal_, &data_, &read) < 0) {
    LOG(DEBUG) << "Memory sink stopped after " << read
               << " bytes: " << strerror(errno);
  }
  transferred_ = read;
  // Keeps the read end open for a moment so a writer that is still finishing
  // up does not see EPIPE. Cut short once the write end is closed.
  std::unique_lock lock(mutex_);
  released_.wait_for(lock, kSinkLinger, [this]() { return closing_; });
}

}  // namespace tiercopy
