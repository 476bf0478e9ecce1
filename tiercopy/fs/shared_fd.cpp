/*
 * Copyright (C) 2016 The Android Open Source Project
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
#include "tiercopy/fs/shared_fd.h"

#include <fcntl.h>
#include <string.h>
#include <sys/sendfile.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <android-base/logging.h>

#include "tiercopy/result/result.h"

namespace tiercopy {

FileInstance::FileInstance(int fd, int in_errno) : fd_(fd), errno_(in_errno) {
  // Ensure every file descriptor managed by a FileInstance has the CLOEXEC
  // flag
  if (fd_ != -1) {
    TEMP_FAILURE_RETRY(fcntl(fd_, F_SETFD, FD_CLOEXEC));
  }
  std::stringstream identity;
  identity << "fd=" << fd << " @" << this;
  identity_ = identity.str();
}

std::shared_ptr<FileInstance> FileInstance::ClosedInstance() {
  return std::shared_ptr<FileInstance>(new FileInstance(-1, EBADF));
}

void FileInstance::Close() {
  if (fd_ == -1) {
    errno_ = EBADF;
  } else if (close(fd_) == -1) {
    errno_ = errno;
    LOG(VERBOSE) << "close: " << identity_ << " failed (" << StrError() << ")";
  } else {
    LOG(VERBOSE) << "close: " << identity_ << " succeeded";
  }
  fd_ = -1;
}

int FileInstance::Fstat(struct stat* buf) {
  errno = 0;
  int rval = TEMP_FAILURE_RETRY(fstat(fd_, buf));
  errno_ = errno;
  return rval;
}

int FileInstance::Fsync() {
  errno = 0;
  int rval = TEMP_FAILURE_RETRY(fsync(fd_));
  errno_ = errno;
  return rval;
}

off_t FileInstance::LSeek(off_t offset, int whence) {
  errno = 0;
  off_t rval = TEMP_FAILURE_RETRY(lseek(fd_, offset, whence));
  errno_ = errno;
  return rval;
}

ssize_t FileInstance::Read(void* buf, size_t count) {
  errno = 0;
  ssize_t rval = TEMP_FAILURE_RETRY(read(fd_, buf, count));
  errno_ = errno;
  return rval;
}

ssize_t FileInstance::Write(const void* buf, size_t count) {
  errno = 0;
  ssize_t rval = TEMP_FAILURE_RETRY(write(fd_, buf, count));
  errno_ = errno;
  return rval;
}

ssize_t FileInstance::SendFile(FileInstance& in, off_t* offset,
                               size_t count) {
  errno = 0;
  ssize_t rval = TEMP_FAILURE_RETRY(sendfile(fd_, in.fd_, offset, count));
  errno_ = errno;
  return rval;
}

ssize_t FileInstance::Splice(off_t* off_in, FileInstance& out,
                             off_t* off_out, size_t len, unsigned int flags) {
  errno = 0;
  ssize_t rval =
      TEMP_FAILURE_RETRY(splice(fd_, off_in, out.fd_, off_out, len, flags));
  errno_ = errno;
  return rval;
}

std::string FileInstance::StrError() const {
  return strerror(errno_);
}

SharedFD::SharedFD(SharedFD&& other) : value_(std::move(other.value_)) {
  other.value_ = FileInstance::ClosedInstance();
}

SharedFD& SharedFD::operator=(SharedFD&& other) {
  value_ = std::move(other.value_);
  other.value_ = FileInstance::ClosedInstance();
  return *this;
}

SharedFD SharedFD::Dup(int unmanaged_fd) {
  int fd = fcntl(unmanaged_fd, F_DUPFD_CLOEXEC, 3);
  int error_num = errno;
  return SharedFD(
      std::shared_ptr<FileInstance>(new FileInstance(fd, error_num)));
}

bool SharedFD::Pipe(SharedFD* fd0, SharedFD* fd1) {
  int fds[2];
  int rval = pipe2(fds, O_CLOEXEC);
  if (rval != -1) {
    (*fd0) = std::shared_ptr<FileInstance>(new FileInstance(fds[0], errno));
    (*fd1) = std::shared_ptr<FileInstance>(new FileInstance(fds[1], errno));
    return true;
  }
  return false;
}

Result<std::pair<SharedFD, SharedFD>> SharedFD::Pipe() {
  SharedFD read_end;
  SharedFD write_end;
  if (!Pipe(&read_end, &write_end)) {
    return TC_ERRNO("pipe2 failed");
  }
  return std::make_pair(std::move(read_end), std::move(write_end));
}

SharedFD SharedFD::Open(const std::string& path, int flags, mode_t mode) {
  int fd = TEMP_FAILURE_RETRY(open(path.c_str(), flags | O_CLOEXEC, mode));
  if (fd == -1) {
    return SharedFD::ErrorFD(errno);
  } else {
    return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(fd, 0)));
  }
}

SharedFD SharedFD::Creat(const std::string& path, mode_t mode) {
  return SharedFD::Open(path, O_CREAT | O_WRONLY | O_TRUNC, mode);
}

bool SharedFD::SocketPair(int domain, int type, int protocol, SharedFD* fd0,
                          SharedFD* fd1) {
  int fds[2];
  int rval = socketpair(domain, type | SOCK_CLOEXEC, protocol, fds);
  if (rval != -1) {
    (*fd0) = std::shared_ptr<FileInstance>(new FileInstance(fds[0], errno));
    (*fd1) = std::shared_ptr<FileInstance>(new FileInstance(fds[1], errno));
    return true;
  }
  return false;
}

SharedFD SharedFD::ErrorFD(int error) {
  return SharedFD(std::shared_ptr<FileInstance>(new FileInstance(-1, error)));
}

}  // namespace tiercopy
