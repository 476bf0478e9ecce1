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

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace tiercopy {

// Runs submitted tasks at some point, on some thread chosen by the
// implementation.
class Executor {
 public:
  virtual ~Executor() = default;

  virtual void Execute(std::function<void()> task) = 0;
};

/**
 * Runs tasks one at a time, in submission order, on a dedicated thread.
 *
 * Shutdown() stops accepting new tasks, runs everything already queued and
 * joins the thread. The destructor calls Shutdown().
 */
class SerialExecutor : public Executor {
 public:
  SerialExecutor();
  ~SerialExecutor() override;

  void Execute(std::function<void()> task) override;
  void Shutdown();

 private:
  void Run();

  std::mutex mutex_;
  std::condition_variable task_added_;
  std::deque<std::function<void()>> tasks_;
  bool shut_down_ = false;
  std::thread runner_;
};

}  // namespace tiercopy
