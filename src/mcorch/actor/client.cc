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

#include "mcorch/actor/client.hh"

#include <ostream>
#include <string>

#include <gsl/gsl>

#include "mcorch/actor/resources.hh"
#include "mcorch/core/ts.hh"

namespace mcorch {
namespace actor {

std::size_t ClientState::Hash::operator()(const ClientState& k) const {
  std::size_t h = 0;
  CombineHash(k.budget, &h);
  for (const auto& kv : k.deployments) {
    CombineHash(kv.first, &h);
    CombineHash(kv.second, &h);
  }
  CombineHashRange(k.standalone.begin(), k.standalone.end(), &h);
  CombineHash(k.next_pod, &h);
  CombineHash(k.next_deployment, &h);
  CombineHash(k.writes, &h);
  CombineHash(k.awaiting, &h);
  return h;
}

std::ostream& operator<<(std::ostream& os, const ClientState& state) {
  for (const auto& kv : state.deployments) {
    os << " |   rs" << kv.first << " -> " << kv.second << std::endl;
  }

  if (!state.standalone.empty()) {
    os << " |   pods =";
    for (const auto pod : state.standalone) os << " pod" << pod;
    os << std::endl;
  }

  if (state.awaiting) {
    os << " |   awaiting response" << std::endl;
  }

  return os;
}

ClientState Client::Init(const system::ClusterConfig& config, ActorId self,
                         Outbox* out) {
  ClientState state;
  state.budget = config.client_budget;

  for (ReplicasetId id = 1; id <= config.initial_replicasets; ++id) {
    state.deployments[id] = config.initial_replicas;
  }

  return state;
}

bool Client::Handle(const system::ClusterConfig& config, const Envelope& env,
                    std::size_t choice, State* state, Outbox* out) {
  if (choice != 0) return false;

  if (env.msg.type != Msg::Type::Response) {
    throw core::Error("client: unexpected message " + ToString(env.msg));
  }

  state->awaiting = false;
  return true;
}

bool Client::Enabled(const system::ClusterConfig& config, const State& state,
                     ClientAction action, std::size_t arg) {
  const auto& budget = state.budget;

  switch (action) {
    case ClientAction::CreateDeployment:
      return budget.create_deployments != 0;
    case ClientAction::ScaleUp:
      return budget.scale_ups != 0 && !state.deployments.empty();
    case ClientAction::ScaleDown:
      return budget.scale_downs != 0 && !state.deployments.empty() &&
             state.deployments.rbegin()->second != 0;
    case ClientAction::CreatePod:
      return budget.create_pods != 0;
    case ClientAction::DeletePod:
      return budget.delete_pods != 0 &&
             (!state.standalone.empty() || !state.deployments.empty());
    case ClientAction::Put:
      return budget.kv_puts != 0 && !state.awaiting &&
             arg < config.kv_keys.size();
    case ClientAction::Range:
      return budget.kv_ranges != 0 && !state.awaiting;
    case ClientAction::DeleteRange:
      return budget.kv_deletes != 0 && !state.awaiting &&
             arg < config.kv_keys.size();
  }

  return false;
}

void Client::Act(const system::ClusterConfig& config, ClientAction action,
                 std::size_t arg, State* state, Outbox* out) {
  Expects(Enabled(config, *state, action, arg));

  auto& budget = state->budget;
  const auto index = config.IndexOf(out->self());

  switch (action) {
    case ClientAction::CreateDeployment: {
      --budget.create_deployments;
      const ReplicasetId id = 1000 + index * 100 + state->next_deployment++;
      state->deployments[id] = config.deployment_replicas;
      out->Send(kDatastoreId,
                Msg::MakeCreateReplicaset(id, config.deployment_replicas));
    } break;

    case ClientAction::ScaleUp: {
      --budget.scale_ups;
      auto& deployment = *state->deployments.rbegin();
      out->Send(kDatastoreId, Msg::MakeScaleReplicaset(deployment.first,
                                                       ++deployment.second));
    } break;

    case ClientAction::ScaleDown: {
      --budget.scale_downs;
      auto& deployment = *state->deployments.rbegin();
      out->Send(kDatastoreId, Msg::MakeScaleReplicaset(deployment.first,
                                                       --deployment.second));
    } break;

    case ClientAction::CreatePod: {
      --budget.create_pods;
      const PodId pod = MakePodId(0, 1 + index * 100 + state->next_pod++);
      state->standalone.push_back(pod);
      out->Send(kDatastoreId,
                Msg::MakeCreatePod(pod, 0, config.pod_cpu, config.pod_mem));
    } break;

    case ClientAction::DeletePod: {
      --budget.delete_pods;
      PodId pod;
      if (!state->standalone.empty()) {
        pod = state->standalone.back();
        state->standalone.pop_back();
      } else {
        pod = MakePodId(state->deployments.rbegin()->first, 0);
      }
      out->Send(kDatastoreId, Msg::MakeDeletePod(pod));
    } break;

    case ClientAction::Put:
      --budget.kv_puts;
      state->awaiting = true;
      out->Send(kDatastoreId,
                Msg::MakePut(config.kv_keys[arg],
                             "c" + std::to_string(index) + "-" +
                                 std::to_string(++state->writes)));
      break;

    case ClientAction::Range:
      --budget.kv_ranges;
      state->awaiting = true;
      out->Send(kDatastoreId,
                Msg::MakeRange(kKvPrefix, PrefixEnd(kKvPrefix)));
      break;

    case ClientAction::DeleteRange:
      --budget.kv_deletes;
      state->awaiting = true;
      out->Send(kDatastoreId, Msg::MakeDeleteRange(config.kv_keys[arg], ""));
      break;
  }
}

}  // namespace actor
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
