/*
 * Copyright (C) 2019 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include "tiercopy/fs/shared_buf.h"

#include <errno.h>

#include <string>
#include <utility>
#include <vector>

#include "tiercopy/fs/shared_fd.h"

namespace tiercopy {

ssize_t ReadExact(SharedFD fd, char* buf, size_t size, size_t* done) {
  size_t total_read = 0;
  ssize_t result = 0;
  while (total_read < size) {
    ssize_t chunk = fd->Read(buf + total_read, size - total_read);
    if (chunk < 0) {
      errno = fd->GetErrno();
      result = -1;
      break;
    } else if (chunk == 0) {
      break;
    }
    total_read += chunk;
  }
  if (done) {
    *done = total_read;
  }
  if (result < 0) {
    return result;
  }
  return total_read;
}

ssize_t ReadExact(SharedFD fd, std::vector<char>* buf, size_t* done) {
  return ReadExact(std::move(fd), buf->data(), buf->size(), done);
}

ssize_t WriteAll(SharedFD fd, const char* buf, size_t size, size_t* done) {
  size_t total_written = 0;
  ssize_t result = 0;
  while (total_written < size) {
    ssize_t chunk = fd->Write(buf + total_written, size - total_written);
    if (chunk < 0) {
      errno = fd->GetErrno();
      result = -1;
      break;
    } else if (chunk == 0) {
      break;
    }
    total_written += chunk;
  }
  if (done) {
    *done = total_written;
  }
  if (result < 0) {
    return result;
  }
  return total_written;
}

ssize_t WriteAll(SharedFD fd, const std::string& buf) {
  return WriteAll(std::move(fd), buf.data(), buf.size());
}

ssize_t WriteAll(SharedFD fd, const std::vector<char>& buf, size_t* done) {
  return WriteAll(std::move(fd), buf.data(), buf.size(), done);
}

}  // namespace tiercopy
