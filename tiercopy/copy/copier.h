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

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <limits>
#include <memory>

#include "tiercopy/copy/checkpoint.h"
#include "tiercopy/copy/endpoint.h"
#include "tiercopy/fs/shared_fd.h"
#include "tiercopy/io/io.h"
#include "tiercopy/result/result.h"

namespace tiercopy {

// Byte count meaning "until the end of the source".
inline constexpr uint64_t kUnboundedCount =
    std::numeric_limits<uint64_t>::max();

inline constexpr size_t kUserspaceBufferSize = 8192;

/**
 * One transfer strategy bound to a source and a destination.
 *
 * Transfer() moves bytes from the current position of the source to the
 * current position of the destination until the source reports the end of
 * the data or `count` bytes were moved. Every chunk is accounted on
 * `checkpoint`, so after a failure checkpoint.Progress() tells how many bytes
 * reached the destination. Nothing is retried or rolled back.
 */
class Copier {
 public:
  virtual ~Copier() = default;

  virtual Result<void> Transfer(uint64_t count,
                                CheckpointController& checkpoint) = 0;
};

// Both descriptors must be regular files.
std::unique_ptr<Copier> SendfileCopier(SharedFD in, SharedFD out);

// At least one of the descriptors must be a pipe.
std::unique_ptr<Copier> SpliceCopier(SharedFD in, SharedFD out);

std::unique_ptr<Copier> UserspaceCopier(SharedFD in, SharedFD out);

// The streams must outlive the returned copier.
std::unique_ptr<Copier> UserspaceCopier(Reader& in, Writer& out);

std::unique_ptr<Copier> CopierForStrategy(CopyStrategy strategy, SharedFD in,
                                          SharedFD out);

}  // namespace tiercopy
