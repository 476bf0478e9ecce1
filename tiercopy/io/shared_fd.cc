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

#include "tiercopy/io/shared_fd.h"

#include <stdint.h>
#include <unistd.h>

#include <utility>

#include "tiercopy/fs/shared_fd.h"
#include "tiercopy/result/result.h"

namespace tiercopy {

SharedFdIo::SharedFdIo(SharedFD fd) : fd_(std::move(fd)) {}

Result<uint64_t> SharedFdIo::Read(void* buf, uint64_t count) {
  ssize_t data_read = fd_->Read(buf, count);
  if (data_read < 0) {
    return TC_ERR_CODE(fd_->GetErrno(), "read failed: " << fd_->StrError());
  }
  return data_read;
}

Result<uint64_t> SharedFdIo::Write(const void* buf, uint64_t count) {
  ssize_t data_written = fd_->Write(buf, count);
  if (data_written < 0) {
    return TC_ERR_CODE(fd_->GetErrno(), "write failed: " << fd_->StrError());
  }
  return data_written;
}

}  // namespace tiercopy
