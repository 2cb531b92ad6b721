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

#ifndef MCORCH_ACTOR_NETWORK_HH_
#define MCORCH_ACTOR_NETWORK_HH_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

#include "mcorch/actor/types.hh"
#include "mcorch/system/config.hh"

namespace mcorch {
namespace actor {

/**
 * Messages in flight between actors, active partitions and the remaining
 * fault budget.
 *
 * In-flight messages form a multiset: they are kept sorted, so that states
 * which only differ in the order messages were sent compare equal. Any
 * message may be delivered next, which models arbitrary delay and
 * reordering.
 *
 * A partition isolates a group of actors (a bit mask of actor ids) from all
 * actors outside the group; messages across an active partition stay in
 * flight until it is healed (or they are dropped).
 */
class Network {
 public:
  struct Hash {
    std::size_t operator()(const Network& k) const {
      std::size_t h = 0;
      CombineHashRange(k.in_flight_.begin(), k.in_flight_.end(), &h);
      CombineHashRange(k.partitions_.begin(), k.partitions_.end(), &h);
      CombineHash(k.budget_, &h);
      return h;
    }
  };

  Network() = default;

  explicit Network(std::size_t capacity, system::FaultBudget budget)
      : capacity_(capacity), budget_(budget) {}

  /**
   * @throw core::BoundExceeded if the network is at capacity.
   */
  void Send(Envelope env);

  //! Removes and returns the message at slot.
  Envelope Take(std::size_t slot);

  const std::vector<Envelope>& in_flight() const { return in_flight_; }

  bool empty() const { return in_flight_.empty(); }

  bool Separated(ActorId a, ActorId b) const;

  bool Deliverable(std::size_t slot) const {
    return slot < in_flight_.size() &&
           !Separated(in_flight_[slot].src, in_flight_[slot].dst);
  }

  bool CanDrop(std::size_t slot) const {
    return slot < in_flight_.size() && budget_.drops != 0;
  }

  void Drop(std::size_t slot);

  /**
   * Messages that belong to a recorded operation are never duplicated: their
   * history entry is delivered at most once.
   */
  bool CanDuplicate(std::size_t slot) const {
    return slot < in_flight_.size() && budget_.duplicates != 0 &&
           in_flight_[slot].op == kNoOp;
  }

  //! @throw core::BoundExceeded if the network is at capacity.
  void Duplicate(std::size_t slot);

  bool IsPartitioned(std::uint64_t group) const;

  bool CanPartition(std::uint64_t group) const {
    return group != 0 && budget_.partitions != 0 && !IsPartitioned(group);
  }

  void Partition(std::uint64_t group);

  //! @return false if group was not partitioned.
  bool Heal(std::uint64_t group);

  const std::vector<std::uint64_t>& partitions() const { return partitions_; }

  const system::FaultBudget& budget() const { return budget_; }

  std::size_t capacity() const { return capacity_; }

  bool operator==(const Network& rhs) const {
    return in_flight_ == rhs.in_flight_ && partitions_ == rhs.partitions_ &&
           budget_ == rhs.budget_;
  }

 private:
  std::size_t capacity_ = 0;
  system::FaultBudget budget_;
  std::vector<Envelope> in_flight_;
  std::vector<std::uint64_t> partitions_;
};

std::ostream& operator<<(std::ostream& os, const Network& network);

}  // namespace actor
}  // namespace mcorch

#endif /* MCORCH_ACTOR_NETWORK_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
