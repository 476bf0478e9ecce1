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

#include "tiercopy/copy/endpoint.h"

#include <sys/stat.h>

#include <atomic>
#include <ostream>

#include "tiercopy/fs/shared_fd.h"
#include "tiercopy/result/result.h"

namespace tiercopy {
namespace {

std::atomic<bool> copy_optimizations_enabled{true};

}  // namespace

std::ostream& operator<<(std::ostream& out, EndpointType type) {
  switch (type) {
    case EndpointType::kRegular:
      return out << "regular";
    case EndpointType::kFifo:
      return out << "fifo";
    case EndpointType::kOther:
      return out << "other";
  }
  return out << "unknown";
}

std::ostream& operator<<(std::ostream& out, CopyStrategy strategy) {
  switch (strategy) {
    case CopyStrategy::kSendfile:
      return out << "sendfile";
    case CopyStrategy::kSplice:
      return out << "splice";
    case CopyStrategy::kUserspace:
      return out << "userspace";
  }
  return out << "unknown";
}

Result<EndpointType> ClassifyEndpoint(const SharedFD& fd) {
  struct stat st;
  if (fd->Fstat(&st) != 0) {
    return TC_ERR_CODE(fd->GetErrno(),
                       "fstat(" << fd->Identity() << ") failed: "
                                << fd->StrError());
  }
  if (S_ISREG(st.st_mode)) {
    return EndpointType::kRegular;
  } else if (S_ISFIFO(st.st_mode)) {
    return EndpointType::kFifo;
  }
  return EndpointType::kOther;
}

CopyStrategy SelectStrategy(EndpointType in, EndpointType out) {
  if (in == EndpointType::kRegular && out == EndpointType::kRegular) {
    return CopyStrategy::kSendfile;
  } else if (in == EndpointType::kFifo || out == EndpointType::kFifo) {
    return CopyStrategy::kSplice;
  }
  return CopyStrategy::kUserspace;
}

Result<CopyStrategy> SelectStrategy(const SharedFD& in, const SharedFD& out) {
  if (!CopyOptimizationsEnabled()) {
    return CopyStrategy::kUserspace;
  }
  EndpointType in_type =
      TC_EXPECT(ClassifyEndpoint(in), "Could not classify copy source");
  EndpointType out_type =
      TC_EXPECT(ClassifyEndpoint(out), "Could not classify copy destination");
  return SelectStrategy(in_type, out_type);
}

void SetCopyOptimizationsEnabled(bool enabled) {
  copy_optimizations_enabled.store(enabled);
}

bool CopyOptimizationsEnabled() { return copy_optimizations_enabled.load(); }

}  // namespace tiercopy
