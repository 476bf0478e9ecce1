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

#include "tiercopy/copy/copy.h"

#include <fcntl.h>
#include <stdint.h>
#include <sys/types.h>

#include <memory>
#include <string>
#include <utility>

#include <android-base/logging.h>

#include "tiercopy/copy/cancellation_signal.h"
#include "tiercopy/copy/checkpoint.h"
#include "tiercopy/copy/copier.h"
#include "tiercopy/copy/endpoint.h"
#include "tiercopy/copy/executor.h"
#include "tiercopy/fs/shared_fd.h"
#include "tiercopy/io/io.h"
#include "tiercopy/io/shared_fd.h"
#include "tiercopy/result/result.h"

namespace tiercopy {
namespace {

Result<uint64_t> RunCopier(Copier& copier, CopyStrategy strategy,
                           uint64_t count, const CancellationSignal* signal,
                           Executor* executor, ProgressListener listener) {
  CheckpointController checkpoint(signal, executor, std::move(listener));
  Result<void> transferred = copier.Transfer(count, checkpoint);
  if (!transferred.ok()) {
    if (IsCanceled(transferred.error())) {
      LOG(INFO) << strategy << " copy canceled after " << checkpoint.Progress()
                << " bytes";
    } else {
      LOG(ERROR) << strategy << " copy failed after " << checkpoint.Progress()
                 << " bytes: " << transferred.error().Message();
    }
  }
  TC_EXPECT(std::move(transferred), "Copy via " << strategy << " stopped after "
                                                << checkpoint.Progress()
                                                << " bytes");
  checkpoint.Finish();
  return checkpoint.Progress();
}

Result<SharedFD> OpenOrError(const std::string& path, int flags,
                             mode_t mode = 0) {
  SharedFD fd = SharedFD::Open(path, flags, mode);
  if (!fd->IsOpen()) {
    return TC_ERR_CODE(fd->GetErrno(),
                       "Could not open '" << path << "': " << fd->StrError());
  }
  return fd;
}

}  // namespace

Result<uint64_t> Copy(const SharedFD& in, const SharedFD& out) {
  return TC_EXPECT(Copy(in, out, kUnboundedCount, nullptr, nullptr, nullptr));
}

Result<uint64_t> Copy(const SharedFD& in, const SharedFD& out,
                      const CancellationSignal* signal, Executor* executor,
                      ProgressListener listener) {
  return TC_EXPECT(Copy(in, out, kUnboundedCount, signal, executor,
                        std::move(listener)));
}

Result<uint64_t> Copy(const SharedFD& in, const SharedFD& out, uint64_t count,
                      const CancellationSignal* signal, Executor* executor,
                      ProgressListener listener) {
  CopyStrategy strategy = TC_EXPECT(SelectStrategy(in, out));
  LOG(DEBUG) << "Copying " << in->Identity() << " to " << out->Identity()
             << " with " << strategy;
  std::unique_ptr<Copier> copier = CopierForStrategy(strategy, in, out);
  return TC_EXPECT(RunCopier(*copier, strategy, count, signal, executor,
                             std::move(listener)));
}

Result<uint64_t> Copy(Reader& in, Writer& out) {
  return TC_EXPECT(Copy(in, out, nullptr, nullptr, nullptr));
}

Result<uint64_t> Copy(Reader& in, Writer& out,
                      const CancellationSignal* signal, Executor* executor,
                      ProgressListener listener) {
  if (CopyOptimizationsEnabled()) {
    auto fd_in = dynamic_cast<SharedFdIo*>(&in);
    auto fd_out = dynamic_cast<SharedFdIo*>(&out);
    if (fd_in && fd_out) {
      return TC_EXPECT(Copy(fd_in->Fd(), fd_out->Fd(), signal, executor,
                            std::move(listener)));
    }
  }
  return TC_EXPECT(
      CopyInternalUserspace(in, out, signal, executor, std::move(listener)));
}

Result<uint64_t> CopyFile(const std::string& from, const std::string& to) {
  return TC_EXPECT(CopyFile(from, to, nullptr, nullptr, nullptr));
}

Result<uint64_t> CopyFile(const std::string& from, const std::string& to,
                          const CancellationSignal* signal,
                          Executor* executor, ProgressListener listener) {
  SharedFD in = TC_EXPECT(OpenOrError(from, O_RDONLY));
  SharedFD out =
      TC_EXPECT(OpenOrError(to, O_WRONLY | O_CREAT | O_TRUNC, 0644));
  return TC_EXPECTF(Copy(in, out, signal, executor, std::move(listener)),
                    "Failed to copy '{}' to '{}'", from, to);
}

Result<uint64_t> CopyToFile(Reader& in, const std::string& to) {
  SharedFD out =
      TC_EXPECT(OpenOrError(to, O_WRONLY | O_CREAT | O_TRUNC, 0644));
  SharedFdIo out_io(out);
  uint64_t copied = TC_EXPECTF(Copy(in, out_io), "Failed to copy to '{}'", to);
  TC_EXPECT(Sync(out));
  return copied;
}

Result<void> Sync(const SharedFD& fd) {
  if (fd->Fsync() != 0) {
    return TC_ERR_CODE(fd->GetErrno(), "fsync(" << fd->Identity()
                                                << ") failed: "
                                                << fd->StrError());
  }
  return {};
}

Result<uint64_t> CopyInternalSendfile(const SharedFD& in, const SharedFD& out,
                                      uint64_t count,
                                      const CancellationSignal* signal,
                                      Executor* executor,
                                      ProgressListener listener) {
  std::unique_ptr<Copier> copier = SendfileCopier(in, out);
  return TC_EXPECT(RunCopier(*copier, CopyStrategy::kSendfile, count, signal,
                             executor, std::move(listener)));
}

Result<uint64_t> CopyInternalSplice(const SharedFD& in, const SharedFD& out,
                                    uint64_t count,
                                    const CancellationSignal* signal,
                                    Executor* executor,
                                    ProgressListener listener) {
  std::unique_ptr<Copier> copier = SpliceCopier(in, out);
  return TC_EXPECT(RunCopier(*copier, CopyStrategy::kSplice, count, signal,
                             executor, std::move(listener)));
}

Result<uint64_t> CopyInternalUserspace(const SharedFD& in, const SharedFD& out,
                                       uint64_t count,
                                       const CancellationSignal* signal,
                                       Executor* executor,
                                       ProgressListener listener) {
  std::unique_ptr<Copier> copier = UserspaceCopier(in, out);
  return TC_EXPECT(RunCopier(*copier, CopyStrategy::kUserspace, count, signal,
                             executor, std::move(listener)));
}

Result<uint64_t> CopyInternalUserspace(Reader& in, Writer& out,
                                       const CancellationSignal* signal,
                                       Executor* executor,
                                       ProgressListener listener) {
  std::unique_ptr<Copier> copier = UserspaceCopier(in, out);
  return TC_EXPECT(RunCopier(*copier, CopyStrategy::kUserspace,
                             kUnboundedCount, signal, executor,
                             std::move(listener)));
}

}  // namespace tiercopy
