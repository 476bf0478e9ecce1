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

#include "tiercopy/io/sized_reader.h"

#include <stdint.h>

#include <algorithm>

#include "tiercopy/io/io.h"
#include "tiercopy/result/result.h"

namespace tiercopy {

SizedReader::SizedReader(Reader& inner, uint64_t limit)
    : inner_(inner), remaining_(limit) {}

Result<uint64_t> SizedReader::Read(void* buf, uint64_t count) {
  if (remaining_ == 0) {
    return 0;
  }
  uint64_t data_read =
      TC_EXPECT(inner_.Read(buf, std::min(count, remaining_)));
  remaining_ -= data_read;
  return data_read;
}

}  // namespace tiercopy
