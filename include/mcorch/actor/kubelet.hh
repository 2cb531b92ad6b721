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

#ifndef MCORCH_ACTOR_KUBELET_HH_
#define MCORCH_ACTOR_KUBELET_HH_

#include <cstddef>
#include <map>
#include <ostream>

#include "mcorch/actor/types.hh"
#include "mcorch/system/config.hh"

namespace mcorch {
namespace actor {

struct KubeletState {
  struct Hash {
    std::size_t operator()(const KubeletState& k) const;
  };

  bool operator==(const KubeletState& rhs) const {
    return running == rhs.running;
  }

  //! Pods started, and the node they run on.
  std::map<PodId, NodeId> running;
};

std::ostream& operator<<(std::ostream& os, const KubeletState& state);

/**
 * Node runtime of all nodes: acknowledges started and stopped pods.
 */
struct Kubelet {
  typedef KubeletState State;

  static State Init(const system::ClusterConfig& config, ActorId self,
                    Outbox* out) {
    return State();
  }

  static bool Handle(const system::ClusterConfig& config, const Envelope& env,
                     std::size_t choice, State* state, Outbox* out);
};

}  // namespace actor
}  // namespace mcorch

#endif /* MCORCH_ACTOR_KUBELET_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
