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

#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

#include "tiercopy/fs/shared_fd.h"

namespace tiercopy {

/**
 * Reads into `buf` until `size` bytes arrived, the other side reached end of
 * file, or a read failed. Short reads are retried.
 *
 * Returns the number of bytes read, which is below `size` only at end of
 * file. Returns -1 with errno set on failure, keeping whatever was read. When
 * `done` is given it receives the byte count in both cases.
 */
ssize_t ReadExact(SharedFD fd, char* buf, size_t size,
                  size_t* done = nullptr);
ssize_t ReadExact(SharedFD fd, std::vector<char>* buf,
                  size_t* done = nullptr);

/**
 * Writes all of `buf`, retrying short writes.
 *
 * Returns the number of bytes written. Returns -1 with errno set on failure,
 * part of the data may have been written by then. When `done` is given it
 * receives the byte count in both cases.
 */
ssize_t WriteAll(SharedFD fd, const char* buf, size_t size,
                 size_t* done = nullptr);
ssize_t WriteAll(SharedFD fd, const std::string& buf);
ssize_t WriteAll(SharedFD fd, const std::vector<char>& buf,
                 size_t* done = nullptr);

}  // namespace tiercopy
