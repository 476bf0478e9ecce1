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

#include "tiercopy/copy/copier.h"

#include <fcntl.h>
#include <stdint.h>

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include "tiercopy/copy/checkpoint.h"
#include "tiercopy/copy/endpoint.h"
#include "tiercopy/fs/shared_fd.h"
#include "tiercopy/io/io.h"
#include "tiercopy/io/shared_fd.h"
#include "tiercopy/io/sized_reader.h"
#include "tiercopy/result/result.h"

namespace tiercopy {
namespace {

class SendfileCopierImpl : public Copier {
 public:
  SendfileCopierImpl(SharedFD in, SharedFD out)
      : in_(std::move(in)), out_(std::move(out)) {}

  Result<void> Transfer(uint64_t count,
                        CheckpointController& checkpoint) override {
    while (count > 0) {
      ssize_t moved = out_->SendFile(
          *in_, nullptr, std::min(count, checkpoint.UntilCheckpoint()));
      if (moved < 0) {
        return TC_ERR_CODE(out_->GetErrno(),
                           "sendfile failed: " << out_->StrError());
      } else if (moved == 0) {
        break;
      }
      count -= moved;
      TC_EXPECT(checkpoint.Advance(moved));
    }
    return {};
  }

 private:
  SharedFD in_;
  SharedFD out_;
};

class SpliceCopierImpl : public Copier {
 public:
  SpliceCopierImpl(SharedFD in, SharedFD out)
      : in_(std::move(in)), out_(std::move(out)) {}

  Result<void> Transfer(uint64_t count,
                        CheckpointController& checkpoint) override {
    while (count > 0) {
      ssize_t moved = in_->Splice(nullptr, *out_, nullptr,
                                  std::min(count, checkpoint.UntilCheckpoint()),
                                  SPLICE_F_MOVE | SPLICE_F_MORE);
      if (moved < 0) {
        return TC_ERR_CODE(in_->GetErrno(),
                           "splice failed: " << in_->StrError());
      } else if (moved == 0) {
        break;
      }
      count -= moved;
      TC_EXPECT(checkpoint.Advance(moved));
    }
    return {};
  }

 private:
  SharedFD in_;
  SharedFD out_;
};

Result<void> UserspaceLoop(Reader& reader, Writer& writer,
                           CheckpointController& checkpoint) {
  std::vector<char> buffer(kUserspaceBufferSize);
  while (true) {
    uint64_t to_read =
        std::min<uint64_t>(buffer.size(), checkpoint.UntilCheckpoint());
    uint64_t chunk_read = TC_EXPECT(reader.Read(buffer.data(), to_read));
    if (chunk_read == 0) {
      return {};
    }
    // Every accepted write is accounted, so a failure reports exactly what
    // reached the writer.
    uint64_t chunk_written = 0;
    while (chunk_written < chunk_read) {
      uint64_t written = TC_EXPECT(writer.Write(&buffer[chunk_written],
                                                chunk_read - chunk_written));
      TC_EXPECT_GT(written, 0, "Premature EOF on writer");
      chunk_written += written;
      TC_EXPECT(checkpoint.Advance(written));
    }
  }
}

class StreamUserspaceCopier : public Copier {
 public:
  StreamUserspaceCopier(Reader& in, Writer& out) : in_(in), out_(out) {}

  Result<void> Transfer(uint64_t count,
                        CheckpointController& checkpoint) override {
    if (count == kUnboundedCount) {
      return UserspaceLoop(in_, out_, checkpoint);
    }
    SizedReader sized_in(in_, count);
    return UserspaceLoop(sized_in, out_, checkpoint);
  }

 private:
  Reader& in_;
  Writer& out_;
};

class FdUserspaceCopier : public Copier {
 public:
  FdUserspaceCopier(SharedFD in, SharedFD out)
      : in_(std::move(in)), out_(std::move(out)), copier_(in_, out_) {}

  Result<void> Transfer(uint64_t count,
                        CheckpointController& checkpoint) override {
    return copier_.Transfer(count, checkpoint);
  }

 private:
  SharedFdIo in_;
  SharedFdIo out_;
  StreamUserspaceCopier copier_;
};

}  // namespace

std::unique_ptr<Copier> SendfileCopier(SharedFD in, SharedFD out) {
  return std::make_unique<SendfileCopierImpl>(std::move(in), std::move(out));
}

std::unique_ptr<Copier> SpliceCopier(SharedFD in, SharedFD out) {
  return std::make_unique<SpliceCopierImpl>(std::move(in), std::move(out));
}

std::unique_ptr<Copier> UserspaceCopier(SharedFD in, SharedFD out) {
  return std::make_unique<FdUserspaceCopier>(std::move(in), std::move(out));
}

std::unique_ptr<Copier> UserspaceCopier(Reader& in, Writer& out) {
  return std::make_unique<StreamUserspaceCopier>(in, out);
}

std::unique_ptr<Copier> CopierForStrategy(CopyStrategy strategy, SharedFD in,
                                          SharedFD out) {
  switch (strategy) {
    case CopyStrategy::kSendfile:
      return SendfileCopier(std::move(in), std::move(out));
    case CopyStrategy::kSplice:
      return SpliceCopier(std::move(in), std::move(out));
    case CopyStrategy::kUserspace:
      break;
  }
  return UserspaceCopier(std::move(in), std::move(out));
}

}  // namespace tiercopy
