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

#ifndef MCORCH_ACTOR_REPLICASET_HH_
#define MCORCH_ACTOR_REPLICASET_HH_

#include <cstddef>
#include <cstdint>
#include <map>
#include <ostream>

#include "mcorch/actor/types.hh"
#include "mcorch/system/config.hh"

namespace mcorch {
namespace actor {

/**
 * A controller's snapshot of one replicaset.
 */
struct ReplicasetView {
  struct PodView {
    bool operator==(const PodView& rhs) const {
      return phase == rhs.phase && revision == rhs.revision;
    }

    PodPhase phase;

    //! Revision of the last applied event; events that are not newer are
    //! ignored.
    Revision revision;
  };

  bool operator==(const ReplicasetView& rhs) const {
    return known == rhs.known && desired == rhs.desired &&
           revision == rhs.revision && pods == rhs.pods;
  }

  //! @return Number of owned pods in an active phase.
  std::uint32_t CurrentScale() const;

  //! Desired scale has been observed.
  bool known = false;
  std::uint32_t desired = 0;
  Revision revision = 0;

  //! Owned pods, including Terminated tombstones.
  std::map<PodId, PodView> pods;
};

struct ReplicasetControllerState {
  struct Hash {
    std::size_t operator()(const ReplicasetControllerState& k) const;
  };

  bool operator==(const ReplicasetControllerState& rhs) const {
    return replicasets == rhs.replicasets;
  }

  std::map<ReplicasetId, ReplicasetView> replicasets;
};

std::ostream& operator<<(std::ostream& os,
                         const ReplicasetControllerState& state);

/**
 * Replicaset controller.
 *
 * Applies ReplicasetChanged and PodChanged events to its snapshot if they are
 * newer than what it has seen for the replicaset (pod), then, if the snapshot
 * changed, reconciles: the current scale is recomputed from the snapshot and
 * the difference to the desired scale is corrected by creating pods with the
 * lowest ordinals never used before, or deleting active pods with the highest
 * ids.
 *
 * Requested creations and deletions are entered into the snapshot right away
 * (without advancing its revision), so that the same correction is not
 * requested again while the request is in flight.
 */
struct ReplicasetController {
  typedef ReplicasetControllerState State;

  static State Init(const system::ClusterConfig& config, ActorId self,
                    Outbox* out) {
    return State();
  }

  static bool Handle(const system::ClusterConfig& config, const Envelope& env,
                     std::size_t choice, State* state, Outbox* out);

  /**
   * Reconciles one replicaset: emits the CreatePod and DeletePod requests
   * that move its current scale to the desired scale.
   */
  static void Reconcile(const system::ClusterConfig& config, ReplicasetId id,
                        ReplicasetView* view, Outbox* out);
};

}  // namespace actor
}  // namespace mcorch

#endif /* MCORCH_ACTOR_REPLICASET_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
