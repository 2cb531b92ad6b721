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

#ifndef MCORCH_ACTOR_CLIENT_HH_
#define MCORCH_ACTOR_CLIENT_HH_

#include <cstddef>
#include <cstdint>
#include <map>
#include <ostream>
#include <vector>

#include "mcorch/actor/types.hh"
#include "mcorch/system/config.hh"

namespace mcorch {
namespace actor {

PRINTABLE_ENUM_CLASS(ClientAction, inline, CreateDeployment, ScaleUp,
                     ScaleDown, CreatePod, DeletePod, Put, Range, DeleteRange);

struct ClientState {
  struct Hash {
    std::size_t operator()(const ClientState& k) const;
  };

  bool operator==(const ClientState& rhs) const {
    return budget == rhs.budget && deployments == rhs.deployments &&
           standalone == rhs.standalone && next_pod == rhs.next_pod &&
           next_deployment == rhs.next_deployment && writes == rhs.writes &&
           awaiting == rhs.awaiting;
  }

  system::ClientBudget budget;

  //! Deployments known to this client, and the scale it last requested.
  std::map<ReplicasetId, std::uint32_t> deployments;

  //! Standalone pods created by this client, not yet deleted.
  std::vector<PodId> standalone;

  std::uint32_t next_pod = 0;
  std::uint32_t next_deployment = 0;
  std::uint32_t writes = 0;

  //! A key-value request is outstanding.
  bool awaiting = false;
};

std::ostream& operator<<(std::ostream& os, const ClientState& state);

/**
 * Workload generator. Each action is taken on request of the engine, limited
 * by the client's budget. Deployments map one-to-one onto replicasets; scaling
 * applies to the deployment with the highest id. At most one key-value
 * request is outstanding per client.
 */
struct Client {
  typedef ClientState State;

  static State Init(const system::ClusterConfig& config, ActorId self,
                    Outbox* out);

  static bool Handle(const system::ClusterConfig& config, const Envelope& env,
                     std::size_t choice, State* state, Outbox* out);

  /**
   * @param arg Index into ClusterConfig::kv_keys for Put and DeleteRange;
   *    must be 0 for all other actions.
   */
  static bool Enabled(const system::ClusterConfig& config, const State& state,
                      ClientAction action, std::size_t arg);

  //! @pre Enabled(config, *state, action, arg)
  static void Act(const system::ClusterConfig& config, ClientAction action,
                  std::size_t arg, State* state, Outbox* out);
};

}  // namespace actor
}  // namespace mcorch

#endif /* MCORCH_ACTOR_CLIENT_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
