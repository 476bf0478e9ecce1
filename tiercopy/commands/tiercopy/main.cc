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

#include <fcntl.h>
#include <signal.h>
#include <stdint.h>
#include <string.h>
#include <unistd.h>

#include <string>
#include <utility>

#include <android-base/logging.h>
#include <gflags/gflags.h>

#include "tiercopy/commands/tiercopy/interrupt.h"
#include "tiercopy/copy/cancellation_signal.h"
#include "tiercopy/copy/copier.h"
#include "tiercopy/copy/copy.h"
#include "tiercopy/copy/endpoint.h"
#include "tiercopy/copy/executor.h"
#include "tiercopy/fs/shared_fd.h"
#include "tiercopy/result/result.h"

DEFINE_uint64(count, 0, "Maximum number of bytes to copy, 0 copies until EOF");
DEFINE_bool(optimizations, true,
            "Use sendfile(2) and splice(2) where possible. When false every "
            "copy goes through a userspace buffer");
DEFINE_bool(progress, false, "Log the number of bytes copied periodically");
DEFINE_bool(sync, false, "fsync(2) the destination after copying");

namespace tiercopy {
namespace {

constexpr int kExitInterrupted = 130;

// Usage examples:
//   * tiercopy in.img out.img
//   * cat in.img | tiercopy --progress - out.img
//   * tiercopy --count=4096 /dev/urandom -

CancellationSignal interrupt_signal;

Result<SharedFD> OpenSource(const std::string& path) {
  SharedFD fd = path == "-" ? SharedFD::Dup(STDIN_FILENO)
                            : SharedFD::Open(path, O_RDONLY);
  TC_EXPECT(fd->IsOpen(), "Could not open source '" << path
                                                    << "': " << fd->StrError());
  return fd;
}

Result<SharedFD> OpenDestination(const std::string& path) {
  SharedFD fd = path == "-" ? SharedFD::Dup(STDOUT_FILENO)
                            : SharedFD::Creat(path, 0644);
  TC_EXPECT(fd->IsOpen(), "Could not open destination '"
                              << path << "': " << fd->StrError());
  return fd;
}

Result<uint64_t> CopyPaths(const std::string& from, const std::string& to) {
  SharedFD in = TC_EXPECT(OpenSource(from));
  SharedFD out = TC_EXPECT(OpenDestination(to));

  SerialExecutor executor;
  ProgressListener listener;
  if (FLAGS_progress) {
    listener = [](uint64_t bytes) { LOG(INFO) << "Copied " << bytes << " bytes"; };
  }
  uint64_t count = FLAGS_count == 0 ? kUnboundedCount : FLAGS_count;
  uint64_t copied = TC_EXPECT(
      Copy(in, out, count, &interrupt_signal, &executor, std::move(listener)));
  if (FLAGS_sync) {
    TC_EXPECT(Sync(out));
  }
  return copied;
}

int TiercopyMain(int argc, char** argv) {
  android::base::InitLogging(argv, android::base::StderrLogger);
  gflags::SetUsageMessage("tiercopy [flags] SOURCE DEST\n"
                          "Copies SOURCE to DEST. '-' names stdin or stdout.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  if (argc != 3) {
    LOG(ERROR) << "Expected a source and a destination, got " << argc - 1
               << " arguments";
    gflags::ShowUsageWithFlagsRestrict(argv[0], "tiercopy");
    return 1;
  }

  Result<void> interrupt_handler = CancelOnInterrupt(interrupt_signal);
  if (!interrupt_handler.ok()) {
    LOG(ERROR) << interrupt_handler.error().Trace();
    return 1;
  }
  signal(SIGPIPE, SIG_IGN);

  SetCopyOptimizationsEnabled(FLAGS_optimizations);

  Result<uint64_t> copied = CopyPaths(argv[1], argv[2]);
  if (!copied.ok()) {
    if (IsCanceled(copied.error())) {
      LOG(INFO) << "Interrupted";
      return kExitInterrupted;
    }
    LOG(ERROR) << copied.error().Trace();
    return 1;
  }
  LOG(DEBUG) << "Copied " << *copied << " bytes";
  return 0;
}

}  // namespace
}  // namespace tiercopy

int main(int argc, char** argv) { return tiercopy::TiercopyMain(argc, argv); }
