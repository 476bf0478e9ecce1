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

#include <mutex>
#include <vector>

#include "tiercopy/io/io.h"
#include "tiercopy/result/result.h"

namespace tiercopy {

// A byte stream over a vector. Reads consume from a cursor that starts at the
// beginning of the data, writes append at the end.
class InMemoryIo : public Reader, public Writer {
 public:
  InMemoryIo() = default;
  explicit InMemoryIo(std::vector<char>);

  Result<uint64_t> Read(void* buf, uint64_t count) override;
  Result<uint64_t> Write(const void* buf, uint64_t count) override;

  std::vector<char> Contents() const;

 private:
  std::vector<char> data_;
  uint64_t cursor_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace tiercopy
