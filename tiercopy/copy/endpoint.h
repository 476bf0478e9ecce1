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

#include <ostream>

#include "tiercopy/fs/shared_fd.h"
#include "tiercopy/result/result.h"

namespace tiercopy {

enum class EndpointType {
  kRegular,
  kFifo,
  // Sockets, character devices and anything else fstat(2) reports.
  kOther,
};

enum class CopyStrategy {
  // sendfile(2) between two regular files.
  kSendfile,
  // splice(2) when at least one side is a pipe.
  kSplice,
  // read(2) / write(2) through a userspace buffer.
  kUserspace,
};

std::ostream& operator<<(std::ostream&, EndpointType);
std::ostream& operator<<(std::ostream&, CopyStrategy);

Result<EndpointType> ClassifyEndpoint(const SharedFD& fd);

CopyStrategy SelectStrategy(EndpointType in, EndpointType out);

// Inspects both descriptors and picks the cheapest strategy for the pair.
// Always kUserspace, without calling fstat(2), while copy optimizations are
// disabled.
Result<CopyStrategy> SelectStrategy(const SharedFD& in, const SharedFD& out);

// Process-wide switch that forces every copy through the userspace loop, for
// environments where sendfile(2) and splice(2) are unavailable.
void SetCopyOptimizationsEnabled(bool enabled);
bool CopyOptimizationsEnabled();

}  // namespace tiercopy
