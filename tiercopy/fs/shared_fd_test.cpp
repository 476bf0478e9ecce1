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


#include "tiercopy/fs/shared_fd.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include <string>
#include <utility>

#include <android-base/file.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "tiercopy/result/result_matchers.h"

namespace tiercopy {
namespace {

char pipe_message[] = "Testing the pipe";

TEST(SharedFDTest, PipeCarriesData) {
  SharedFD fds[2];
  ASSERT_TRUE(SharedFD::Pipe(fds, fds + 1));
  EXPECT_TRUE(fds[0]->IsOpen());
  EXPECT_TRUE(fds[1]->IsOpen());
  EXPECT_EQ(sizeof(pipe_message),
            fds[1]->Write(pipe_message, sizeof(pipe_message)));
  char buf[80];
  EXPECT_EQ(sizeof(pipe_message), fds[0]->Read(buf, sizeof(buf)));
  EXPECT_EQ(0, strcmp(buf, pipe_message));
}

TEST(SharedFDTest, PipeResult) {
  auto pipe = SharedFD::Pipe();
  ASSERT_THAT(pipe, IsOk());
  auto& [read_end, write_end] = *pipe;
  EXPECT_TRUE(read_end->IsOpen());
  EXPECT_TRUE(write_end->IsOpen());
  EXPECT_NE(read_end, write_end);
}

TEST(SharedFDTest, DefaultIsClosed) {
  SharedFD fd;
  EXPECT_FALSE(fd->IsOpen());
  char buf[1];
  EXPECT_EQ(-1, fd->Read(buf, sizeof(buf)));
  EXPECT_EQ(EBADF, fd->GetErrno());
}

TEST(SharedFDTest, OpenMissingFileKeepsErrno) {
  SharedFD fd = SharedFD::Open("/nonexistent/tiercopy/file", O_RDONLY);
  EXPECT_FALSE(fd->IsOpen());
  EXPECT_EQ(ENOENT, fd->GetErrno());
  EXPECT_FALSE(fd->StrError().empty());
}

TEST(SharedFDTest, CloseIsIdempotent) {
  SharedFD read_end, write_end;
  ASSERT_TRUE(SharedFD::Pipe(&read_end, &write_end));
  write_end->Close();
  EXPECT_FALSE(write_end->IsOpen());
  write_end->Close();
  EXPECT_EQ(EBADF, write_end->GetErrno());

  char buf[1];
  EXPECT_EQ(0, read_end->Read(buf, sizeof(buf)));
}

TEST(SharedFDTest, MovedFromIsClosed) {
  SharedFD read_end, write_end;
  ASSERT_TRUE(SharedFD::Pipe(&read_end, &write_end));
  SharedFD moved = std::move(read_end);
  EXPECT_TRUE(moved->IsOpen());
  EXPECT_FALSE(read_end->IsOpen());
}

TEST(SharedFDTest, DupIsIndependent) {
  TemporaryFile file;
  SharedFD dup = SharedFD::Dup(file.fd);
  ASSERT_TRUE(dup->IsOpen());
  EXPECT_EQ(5, dup->Write("hello", 5));
  dup->Close();

  std::string contents;
  ASSERT_TRUE(android::base::ReadFileToString(file.path, &contents));
  EXPECT_EQ("hello", contents);
}

TEST(SharedFDTest, SendFileBetweenRegularFiles) {
  TemporaryFile from;
  TemporaryFile to;
  ASSERT_TRUE(android::base::WriteStringToFile("sendfile", from.path));

  SharedFD in = SharedFD::Open(from.path, O_RDONLY);
  SharedFD out = SharedFD::Open(to.path, O_WRONLY | O_TRUNC);
  ASSERT_TRUE(in->IsOpen());
  ASSERT_TRUE(out->IsOpen());
  EXPECT_EQ(8, out->SendFile(*in, nullptr, 64));
  EXPECT_EQ(0, out->SendFile(*in, nullptr, 64));

  std::string contents;
  ASSERT_TRUE(android::base::ReadFileToString(to.path, &contents));
  EXPECT_EQ("sendfile", contents);
}

TEST(SharedFDTest, SpliceOutOfPipe) {
  SharedFD read_end, write_end;
  ASSERT_TRUE(SharedFD::Pipe(&read_end, &write_end));
  TemporaryFile to;
  SharedFD out = SharedFD::Open(to.path, O_WRONLY | O_TRUNC);
  ASSERT_TRUE(out->IsOpen());

  ASSERT_EQ(6, write_end->Write("splice", 6));
  EXPECT_EQ(6, read_end->Splice(nullptr, *out, nullptr, 64, 0));

  std::string contents;
  ASSERT_TRUE(android::base::ReadFileToString(to.path, &contents));
  EXPECT_EQ("splice", contents);
}

TEST(SharedFDTest, SpliceBetweenRegularFilesFails) {
  TemporaryFile from;
  TemporaryFile to;
  SharedFD in = SharedFD::Open(from.path, O_RDONLY);
  SharedFD out = SharedFD::Open(to.path, O_WRONLY);
  EXPECT_EQ(-1, in->Splice(nullptr, *out, nullptr, 64, 0));
  EXPECT_EQ(EINVAL, in->GetErrno());
}

TEST(SharedFDTest, SocketPairIsConnected) {
  SharedFD first, second;
  ASSERT_TRUE(SharedFD::SocketPair(AF_UNIX, SOCK_STREAM, 0, &first, &second));
  EXPECT_EQ(4, first->Write("ping", 4));
  char buf[4];
  EXPECT_EQ(4, second->Read(buf, sizeof(buf)));
  EXPECT_EQ(std::string("ping"), std::string(buf, sizeof(buf)));
}

}  // namespace
}  // namespace tiercopy
