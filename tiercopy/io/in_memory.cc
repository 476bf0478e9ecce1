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

#include "tiercopy/io/in_memory.h"

#include <stdint.h>
#include <string.h>

#include <algorithm>
#include <mutex>
#include <utility>
#include <vector>

#include "tiercopy/result/result.h"

namespace tiercopy {

InMemoryIo::InMemoryIo(std::vector<char> data) : data_(std::move(data)) {}

Result<uint64_t> InMemoryIo::Read(void* buf, uint64_t count) {
  std::lock_guard lock(mutex_);
  uint64_t to_read = std::min<uint64_t>(count, data_.size() - cursor_);
  memcpy(buf, data_.data() + cursor_, to_read);
  cursor_ += to_read;
  return to_read;
}

Result<uint64_t> InMemoryIo::Write(const void* buf, uint64_t count) {
  std::lock_guard lock(mutex_);
  const char* bytes = static_cast<const char*>(buf);
  data_.insert(data_.end(), bytes, bytes + count);
  return count;
}

std::vector<char> InMemoryIo::Contents() const {
  std::lock_guard lock(mutex_);
  return data_;
}

}  // namespace tiercopy
