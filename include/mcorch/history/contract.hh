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

#ifndef MCORCH_HISTORY_CONTRACT_HH_
#define MCORCH_HISTORY_CONTRACT_HH_

#include <string>

#include "mcorch/util.hh"

namespace mcorch {
namespace history {

/**
 * Consistency contract of the datastore.
 *
 *  - Linearizable: all operations admit one total order that respects
 *    real-time precedence.
 *  - Session: each session observes its own writes and never an older
 *    revision than one it has observed; sessions are not ordered w.r.t. each
 *    other.
 *  - MonotonicSession: Session, and revisions observed by reads never regress
 *    across sessions.
 */
PRINTABLE_ENUM_CLASS(Contract, inline, Linearizable, Session,
                     MonotonicSession);

/**
 * Parses "linearizable", "session" or "monotonic-session".
 *
 * @throw std::invalid_argument on any other value.
 */
Contract ParseContract(const std::string& name);

//! @return The name accepted by ParseContract.
const char* ContractName(Contract contract);

}  // namespace history
}  // namespace mcorch

#endif /* MCORCH_HISTORY_CONTRACT_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
