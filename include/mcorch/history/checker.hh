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

#ifndef MCORCH_HISTORY_CHECKER_HH_
#define MCORCH_HISTORY_CHECKER_HH_

#include <ostream>
#include <string>
#include <vector>

#include "mcorch/history/contract.hh"
#include "mcorch/history/history.hh"

namespace mcorch {
namespace history {

struct CheckResult {
  bool consistent = true;
  std::string reason;

  //! Ids of the operations that cannot be ordered consistently.
  std::vector<OpId> conflict;
};

std::ostream& operator<<(std::ostream& os, const CheckResult& result);

/**
 * Decides whether a history is consistent under a contract.
 *
 * Effective writes are fixed at their commit revision. Every completed read
 * must return the view of its range at the revision it was served from, and
 * can be placed at any revision showing the same view. Real-time precedence
 * (a completes before b starts) orders the pairs the contract constrains:
 *
 *  - Linearizable: all pairs;
 *  - Session: pairs of the same session;
 *  - MonotonicSession: pairs of the same session, and all pairs of reads.
 *
 * A write preceding a read must be visible to it, a read preceding a write
 * must not see it, and preceding reads must not be placed later. Reads are
 * placed in completion order at the earliest admissible revision; since
 * placement only ever raises the lower bound of later reads, the history is
 * consistent iff every read can be placed.
 */
class Checker {
 public:
  explicit Checker(Contract contract) : contract_(contract) {}

  CheckResult operator()(const History& history) const;

  Contract contract() const { return contract_; }

  //! @return true if a must be ordered before b.
  bool Precedes(const Operation& a, const Operation& b) const;

 private:
  Contract contract_;
};

}  // namespace history
}  // namespace mcorch

#endif /* MCORCH_HISTORY_CHECKER_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
