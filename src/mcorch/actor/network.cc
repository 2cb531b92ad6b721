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

#include "mcorch/actor/network.hh"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <utility>

#include <gsl/gsl>

#include "mcorch/core/ts.hh"

namespace mcorch {
namespace actor {

void Network::Send(Envelope env) {
  if (in_flight_.size() >= capacity_) {
    throw core::BoundExceeded("network capacity");
  }

  auto pos = std::upper_bound(in_flight_.begin(), in_flight_.end(), env);
  in_flight_.insert(pos, std::move(env));
}

Envelope Network::Take(std::size_t slot) {
  Expects(slot < in_flight_.size());
  Envelope env = std::move(in_flight_[slot]);
  in_flight_.erase(in_flight_.begin() + slot);
  return env;
}

bool Network::Separated(ActorId a, ActorId b) const {
  for (const auto group : partitions_) {
    const bool a_in = (group >> a) & 1;
    const bool b_in = (group >> b) & 1;
    if (a_in != b_in) return true;
  }

  return false;
}

void Network::Drop(std::size_t slot) {
  Expects(CanDrop(slot));
  --budget_.drops;
  in_flight_.erase(in_flight_.begin() + slot);
}

void Network::Duplicate(std::size_t slot) {
  Expects(CanDuplicate(slot));
  --budget_.duplicates;
  Send(in_flight_[slot]);
}

bool Network::IsPartitioned(std::uint64_t group) const {
  return std::binary_search(partitions_.begin(), partitions_.end(), group);
}

void Network::Partition(std::uint64_t group) {
  Expects(CanPartition(group));
  --budget_.partitions;
  partitions_.insert(
      std::upper_bound(partitions_.begin(), partitions_.end(), group), group);
}

bool Network::Heal(std::uint64_t group) {
  auto it = std::lower_bound(partitions_.begin(), partitions_.end(), group);
  if (it == partitions_.end() || *it != group) return false;
  partitions_.erase(it);
  return true;
}

std::ostream& operator<<(std::ostream& os, const Network& network) {
  os << " +---< Network >" << std::endl;
  os << " |   faults left = " << network.budget().drops << " drops, "
     << network.budget().duplicates << " duplicates, "
     << network.budget().partitions << " partitions" << std::endl;

  for (const auto group : network.partitions()) {
    os << " |   partitioned = 0x" << std::hex << group << std::dec
       << std::endl;
  }

  for (std::size_t i = 0; i < network.in_flight().size(); ++i) {
    os << " |   [" << i << "] " << network.in_flight()[i]
       << (network.Deliverable(i) ? "" : " (blocked)") << std::endl;
  }

  return os;
}

}  // namespace actor
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
