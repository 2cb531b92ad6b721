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

#ifndef MCORCH_OS_HH_
#define MCORCH_OS_HH_

#include <cstdint>

#include <gflags/gflags.h>

DECLARE_uint64(os_memlimit);

namespace mcorch {
namespace os {

/**
 * Lowers the address space limit (RLIMIT_AS) of the process to mib MiB, so
 * that a search running out of memory fails with std::bad_alloc instead of
 * being killed. An existing lower limit is kept. Does nothing if mib is 0.
 *
 * @return false if the limit could not be applied as requested.
 */
bool LimitAddressSpace(std::uint64_t mib);

}  // namespace os
}  // namespace mcorch

#endif /* MCORCH_OS_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
