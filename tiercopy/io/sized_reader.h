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

#include "tiercopy/io/io.h"
#include "tiercopy/result/result.h"

namespace tiercopy {

// Reads at most `limit` bytes from the wrapped reader, then reports the end
// of the data. The wrapped reader must outlive this object.
class SizedReader : public Reader {
 public:
  SizedReader(Reader& inner, uint64_t limit);

  Result<uint64_t> Read(void* buf, uint64_t count) override;

  uint64_t Remaining() const { return remaining_; }

 private:
  Reader& inner_;
  uint64_t remaining_;
};

}  // namespace tiercopy
