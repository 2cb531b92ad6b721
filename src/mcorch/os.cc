/*
 * Copyright (c) 2016, The University of Edinburgh
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
*/

#include "mcorch/os.hh"

#include <cerrno>
#include <cstring>

#include <glog/logging.h>
#include <sys/resource.h>

DEFINE_uint64(os_memlimit, gflags::Uint64FromEnv("MCORCH_MEMLIMIT", 4 * 1024),
              "Address space limit in MiB, 0 for none; exceeding it during a "
              "search yields an inconclusive verdict");

namespace mcorch {
namespace os {

bool LimitAddressSpace(std::uint64_t mib) {
  if (mib == 0) return true;

  struct rlimit rl;
  if (getrlimit(RLIMIT_AS, &rl) != 0) {
    LOG(WARNING) << "getrlimit(RLIMIT_AS): " << std::strerror(errno);
    return false;
  }

  rlim_t limit = static_cast<rlim_t>(mib) * 1024 * 1024;
  if (rl.rlim_cur != RLIM_INFINITY && rl.rlim_cur < limit) {
    LOG(WARNING) << "Keeping lower address space limit of "
                 << rl.rlim_cur / (1024 * 1024) << " MiB";
    return false;
  }

  bool as_requested = true;
  if (rl.rlim_max != RLIM_INFINITY && rl.rlim_max < limit) {
    LOG(WARNING) << "Address space limit capped at hard limit";
    limit = rl.rlim_max;
    as_requested = false;
  }

  rl.rlim_cur = limit;
  if (setrlimit(RLIMIT_AS, &rl) != 0) {
    LOG(WARNING) << "setrlimit(RLIMIT_AS): " << std::strerror(errno);
    return false;
  }

  LOG(INFO) << "Address space limited to " << limit / (1024 * 1024) << " MiB";
  return as_requested;
}

}  // namespace os
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
