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

#include <functional>
#include <utility>
#include <vector>

#include "tiercopy/copy/executor.h"

namespace tiercopy {

// Holds submitted tasks until RunAll() so tests control when they run.
class QueuedExecutor : public Executor {
 public:
  void Execute(std::function<void()> task) override {
    tasks_.emplace_back(std::move(task));
  }

  size_t Pending() const { return tasks_.size(); }

  void RunAll() {
    std::vector<std::function<void()>> tasks;
    tasks.swap(tasks_);
    for (auto& task : tasks) {
      task();
    }
  }

 private:
  std::vector<std::function<void()>> tasks_;
};

}  // namespace tiercopy
