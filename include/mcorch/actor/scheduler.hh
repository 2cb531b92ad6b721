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

#ifndef MCORCH_ACTOR_SCHEDULER_HH_
#define MCORCH_ACTOR_SCHEDULER_HH_

#include <cstddef>
#include <map>
#include <ostream>
#include <vector>

#include "mcorch/actor/resources.hh"
#include "mcorch/actor/types.hh"
#include "mcorch/system/config.hh"

namespace mcorch {
namespace actor {

struct SchedulerState {
  struct Binding {
    bool operator==(const Binding& rhs) const {
      return node == rhs.node && request == rhs.request;
    }

    NodeId node;
    Resources request;
  };

  struct Hash {
    std::size_t operator()(const SchedulerState& k) const;
  };

  bool operator==(const SchedulerState& rhs) const {
    return nodes == rhs.nodes && bindings == rhs.bindings &&
           waiting == rhs.waiting;
  }

  //! @return Node with id, or nullptr.
  const Node* FindNode(NodeId id) const;

  //! Ordered by node id.
  std::vector<Node> nodes;

  //! Pods bound by this scheduler.
  std::map<PodId, Binding> bindings;

  //! Requests that fit on no node, retried whenever capacity is released.
  std::map<PodId, Resources> waiting;
};

std::ostream& operator<<(std::ostream& os, const SchedulerState& state);

/**
 * Binds pending pods to nodes.
 *
 * Placement is first-fit: nodes are scanned lowest id first. A pod that fits
 * nowhere waits; released capacity (a rejected binding or ReleasePod) is
 * offered to the waiting pods, lowest pod id first.
 */
struct Scheduler {
  typedef SchedulerState State;

  static State Init(const system::ClusterConfig& config, ActorId self,
                    Outbox* out);

  static bool Handle(const system::ClusterConfig& config, const Envelope& env,
                     std::size_t choice, State* state, Outbox* out);
};

}  // namespace actor
}  // namespace mcorch

#endif /* MCORCH_ACTOR_SCHEDULER_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
