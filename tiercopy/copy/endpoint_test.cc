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


#include "tiercopy/copy/endpoint.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/socket.h>

#include <android-base/file.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "tiercopy/fs/shared_fd.h"
#include "tiercopy/result/result_matchers.h"

namespace tiercopy {
namespace {

class EndpointTest : public ::testing::Test {
 protected:
  void TearDown() override { SetCopyOptimizationsEnabled(true); }
};

TEST_F(EndpointTest, ClassifiesRegularFile) {
  TemporaryFile file;
  SharedFD fd = SharedFD::Open(file.path, O_RDONLY);
  EXPECT_THAT(ClassifyEndpoint(fd), IsOkAndValue(EndpointType::kRegular));
}

TEST_F(EndpointTest, ClassifiesPipe) {
  SharedFD read_end, write_end;
  ASSERT_TRUE(SharedFD::Pipe(&read_end, &write_end));
  EXPECT_THAT(ClassifyEndpoint(read_end), IsOkAndValue(EndpointType::kFifo));
  EXPECT_THAT(ClassifyEndpoint(write_end), IsOkAndValue(EndpointType::kFifo));
}

TEST_F(EndpointTest, ClassifiesSocketAsOther) {
  SharedFD first, second;
  ASSERT_TRUE(SharedFD::SocketPair(AF_UNIX, SOCK_STREAM, 0, &first, &second));
  EXPECT_THAT(ClassifyEndpoint(first), IsOkAndValue(EndpointType::kOther));
}

TEST_F(EndpointTest, ClassifiesCharacterDeviceAsOther) {
  SharedFD null = SharedFD::Open("/dev/null", O_WRONLY);
  ASSERT_TRUE(null->IsOpen());
  EXPECT_THAT(ClassifyEndpoint(null), IsOkAndValue(EndpointType::kOther));
}

TEST_F(EndpointTest, ClosedDescriptorFails) {
  Result<EndpointType> type = ClassifyEndpoint(SharedFD());
  ASSERT_THAT(type, IsError());
  EXPECT_EQ(EBADF, type.error().ErrorCode());
}

TEST_F(EndpointTest, StrategyTable) {
  constexpr auto kRegular = EndpointType::kRegular;
  constexpr auto kFifo = EndpointType::kFifo;
  constexpr auto kOther = EndpointType::kOther;

  EXPECT_EQ(CopyStrategy::kSendfile, SelectStrategy(kRegular, kRegular));
  EXPECT_EQ(CopyStrategy::kSplice, SelectStrategy(kFifo, kRegular));
  EXPECT_EQ(CopyStrategy::kSplice, SelectStrategy(kRegular, kFifo));
  EXPECT_EQ(CopyStrategy::kSplice, SelectStrategy(kFifo, kFifo));
  EXPECT_EQ(CopyStrategy::kSplice, SelectStrategy(kFifo, kOther));
  EXPECT_EQ(CopyStrategy::kSplice, SelectStrategy(kOther, kFifo));
  EXPECT_EQ(CopyStrategy::kUserspace, SelectStrategy(kRegular, kOther));
  EXPECT_EQ(CopyStrategy::kUserspace, SelectStrategy(kOther, kRegular));
  EXPECT_EQ(CopyStrategy::kUserspace, SelectStrategy(kOther, kOther));
}

TEST_F(EndpointTest, SelectsFromDescriptors) {
  TemporaryFile from;
  TemporaryFile to;
  SharedFD in = SharedFD::Open(from.path, O_RDONLY);
  SharedFD out = SharedFD::Open(to.path, O_WRONLY);
  EXPECT_THAT(SelectStrategy(in, out), IsOkAndValue(CopyStrategy::kSendfile));

  SharedFD read_end, write_end;
  ASSERT_TRUE(SharedFD::Pipe(&read_end, &write_end));
  EXPECT_THAT(SelectStrategy(read_end, out), IsOkAndValue(CopyStrategy::kSplice));
}

TEST_F(EndpointTest, DisabledOptimizationsSkipProbing) {
  SetCopyOptimizationsEnabled(false);
  EXPECT_FALSE(CopyOptimizationsEnabled());

  TemporaryFile from;
  SharedFD in = SharedFD::Open(from.path, O_RDONLY);
  EXPECT_THAT(SelectStrategy(in, in), IsOkAndValue(CopyStrategy::kUserspace));
  // Closed descriptors are not even inspected.
  EXPECT_THAT(SelectStrategy(SharedFD(), SharedFD()),
              IsOkAndValue(CopyStrategy::kUserspace));
}

}  // namespace
}  // namespace tiercopy
