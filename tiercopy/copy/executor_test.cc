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

#include <mutex>
#include <thread>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace tiercopy {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(SerialExecutorTest, RunsInSubmissionOrder) {
  std::mutex mutex;
  std::vector<int> order;
  {
    SerialExecutor executor;
    for (int i = 0; i < 5; i++) {
      executor.Execute([&mutex, &order, i]() {
        std::lock_guard lock(mutex);
        order.push_back(i);
      });
    }
  }
  EXPECT_THAT(order, ElementsAre(0, 1, 2, 3, 4));
}

TEST(SerialExecutorTest, RunsOffTheCallingThread) {
  std::thread::id task_thread;
  SerialExecutor executor;
  executor.Execute([&task_thread]() { task_thread = std::this_thread::get_id(); });
  executor.Shutdown();
  EXPECT_NE(std::this_thread::get_id(), task_thread);
}

TEST(SerialExecutorTest, DropsTasksAfterShutdown) {
  std::vector<int> ran;
  SerialExecutor executor;
  executor.Execute([&ran]() { ran.push_back(1); });
  executor.Shutdown();
  executor.Execute([&ran]() { ran.push_back(2); });
  executor.Shutdown();
  EXPECT_THAT(ran, ElementsAre(1));
}

TEST(SerialExecutorTest, ShutdownWithoutTasks) {
  std::vector<int> ran;
  SerialExecutor executor;
  executor.Shutdown();
  EXPECT_THAT(ran, IsEmpty());
}

}  // namespace
}  // namespace tiercopy
