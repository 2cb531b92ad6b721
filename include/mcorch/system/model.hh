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

#ifndef MCORCH_SYSTEM_MODEL_HH_
#define MCORCH_SYSTEM_MODEL_HH_

#include <vector>

#include "mcorch/actor/resources.hh"
#include "mcorch/core/ts.hh"
#include "mcorch/history/contract.hh"
#include "mcorch/system/config.hh"
#include "mcorch/system/state.hh"

namespace mcorch {
namespace system {

typedef core::TransitionSystem<SystemState> TransitionSystem;

struct ModelOptions {
  //! Check the history against contract at every state.
  bool incremental_consistency = false;
  history::Contract contract = history::Contract::Linearizable;

  //! Register the liveness properties.
  bool liveness = true;
};

/**
 * Builds the transition system of the cluster: one rule per action the engine
 * may choose (message delivery per slot and choice, drop, duplicate,
 * partition and heal per group, client action), the safety invariants and,
 * optionally, the liveness properties.
 */
TransitionSystem MakeTransitionSystem(const ClusterConfig& config,
                                      const ModelOptions& options);

/**
 * Node allocations according to the pods bound in the datastore.
 */
std::vector<actor::Node> BoundAllocations(const SystemState& state);

bool NodeCapacityHolds(const SystemState& state);

bool SchedulerCapacityHolds(const SystemState& state);

bool RevisionsMonotonic(const SystemState& state);

//! No pending pod fits on a node, given the bound allocations.
bool PodsScheduled(const SystemState& state);

//! Every replicaset has as many active pods as desired.
bool ReplicasetsConverged(const SystemState& state);

}  // namespace system
}  // namespace mcorch

#endif /* MCORCH_SYSTEM_MODEL_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
