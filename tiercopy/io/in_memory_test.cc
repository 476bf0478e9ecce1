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

#include <string>
#include <string_view>
#include <vector>

#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "tiercopy/result/result_matchers.h"

namespace tiercopy {

TEST(InMemoryIoTest, ReadConsumes) {
  InMemoryIo instance(std::vector<char>{'a', 'b', 'c', 'd'});

  std::string data_read(3, '\0');
  ASSERT_THAT(instance.Read(data_read.data(), data_read.size()),
              IsOkAndValue(3));
  EXPECT_EQ("abc", data_read);

  ASSERT_THAT(instance.Read(data_read.data(), data_read.size()),
              IsOkAndValue(1));
  EXPECT_EQ('d', data_read[0]);
  EXPECT_THAT(instance.Read(data_read.data(), data_read.size()),
              IsOkAndValue(0));
}

TEST(InMemoryIoTest, WritesAppend) {
  InMemoryIo instance;

  constexpr std::string_view str = "hello";
  ASSERT_THAT(instance.Write(str.data(), str.size()), IsOkAndValue(str.size()));
  ASSERT_THAT(instance.Write(str.data(), str.size()), IsOkAndValue(str.size()));

  std::vector<char> contents = instance.Contents();
  EXPECT_EQ(absl::StrCat(str, str), std::string(contents.begin(), contents.end()));
}

TEST(InMemoryIoTest, ReadsAfterWrites) {
  InMemoryIo instance;

  constexpr std::string_view str = "hello";
  ASSERT_THAT(instance.Write(str.data(), str.size()), IsOkAndValue(str.size()));

  std::string data_read(str.size(), '\0');
  ASSERT_THAT(instance.Read(data_read.data(), data_read.size()),
              IsOkAndValue(str.size()));
  EXPECT_EQ(str, data_read);
}

}  // namespace tiercopy
