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

#include "mcorch/history/contract.hh"

#include <stdexcept>
#include <string>

namespace mcorch {
namespace history {

Contract ParseContract(const std::string& name) {
  if (name == "linearizable") return Contract::Linearizable;
  if (name == "session") return Contract::Session;
  if (name == "monotonic-session") return Contract::MonotonicSession;

  throw std::invalid_argument("unknown consistency contract '" + name +
                              "' (expected linearizable, session or "
                              "monotonic-session)");
}

const char* ContractName(Contract contract) {
  switch (contract) {
    case Contract::Linearizable:
      return "linearizable";
    case Contract::Session:
      return "session";
    case Contract::MonotonicSession:
      return "monotonic-session";
  }

  return "unknown";
}

}  // namespace history
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
