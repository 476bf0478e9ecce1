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

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "tiercopy/io/in_memory.h"
#include "tiercopy/io/shared_fd.h"
#include "tiercopy/result/result_matchers.h"

namespace tiercopy {
namespace {

TEST(SizedReaderTest, StopsAtLimit) {
  InMemoryIo inner(std::vector<char>(100, 'x'));
  SizedReader reader(inner, 10);

  std::vector<char> buf(64);
  EXPECT_THAT(reader.Read(buf.data(), buf.size()), IsOkAndValue(10));
  EXPECT_EQ(0, reader.Remaining());
  EXPECT_THAT(reader.Read(buf.data(), buf.size()), IsOkAndValue(0));

  // The rest of the data is still available from the inner reader.
  EXPECT_THAT(inner.Read(buf.data(), buf.size()), IsOkAndValue(64));
}

TEST(SizedReaderTest, ShortInnerReader) {
  InMemoryIo inner(std::vector<char>(5, 'x'));
  SizedReader reader(inner, 10);

  std::vector<char> buf(64);
  EXPECT_THAT(reader.Read(buf.data(), buf.size()), IsOkAndValue(5));
  EXPECT_EQ(5, reader.Remaining());
  EXPECT_THAT(reader.Read(buf.data(), buf.size()), IsOkAndValue(0));
}

TEST(SizedReaderTest, PropagatesErrors) {
  SharedFdIo closed{SharedFD()};
  SizedReader reader(closed, 10);

  char buf[4];
  EXPECT_THAT(reader.Read(buf, sizeof(buf)), IsError());
}

}  // namespace
}  // namespace tiercopy
