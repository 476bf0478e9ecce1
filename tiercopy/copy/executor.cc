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

#include "tiercopy/copy/executor.h"

#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>

#include <android-base/logging.h>

namespace tiercopy {

SerialExecutor::SerialExecutor() : runner_([this]() { Run(); }) {}

SerialExecutor::~SerialExecutor() { Shutdown(); }

void SerialExecutor::Execute(std::function<void()> task) {
  if (!task) {
    return;
  }
  std::lock_guard lock(mutex_);
  if (shut_down_) {
    LOG(WARNING) << "Dropping task submitted after executor shutdown";
    return;
  }
  tasks_.push_back(std::move(task));
  task_added_.notify_one();
}

void SerialExecutor::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    if (shut_down_) {
      return;
    }
    shut_down_ = true;
    task_added_.notify_one();
  }
  if (runner_.joinable()) {
    runner_.join();
  }
}

void SerialExecutor::Run() {
  while (true) {
    std::deque<std::function<void()>> batch;
    {
      std::unique_lock lock(mutex_);
      task_added_.wait(lock, [this]() { return shut_down_ || !tasks_.empty(); });
      if (tasks_.empty()) {
        // Only reached after shutdown, once everything queued has run.
        return;
      }
      batch.swap(tasks_);
    }
    for (auto& task : batch) {
      task();
    }
  }
}

}  // namespace tiercopy
