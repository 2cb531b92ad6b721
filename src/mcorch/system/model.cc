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

#include "mcorch/system/model.hh"

#include <map>
#include <memory>
#include <sstream>
#include <string>

#include "mcorch/core/liveness.hh"
#include "mcorch/history/checker.hh"

namespace mcorch {
namespace system {

namespace {

using actor::ClientAction;

/**
 * Delivers the message in a slot of the network. A Range request to the
 * datastore is delivered once per readable view (choice); all other messages
 * only with choice 0.
 */
class DeliverRule : public core::Rule<SystemState> {
 public:
  explicit DeliverRule(std::size_t slot, std::size_t choice)
      : core::Rule<SystemState>(MakeName(slot, choice)),
        slot_(slot),
        choice_(choice) {}

  bool Enabled(const SystemState& state) const override {
    const auto& network = state.network();
    if (!network.Deliverable(slot_)) return false;
    if (choice_ == 0) return true;

    const auto& env = network.in_flight()[slot_];
    return env.dst == actor::kDatastoreId &&
           env.msg.type == actor::Msg::Type::Range;
  }

  bool Apply(SystemState* state) const override {
    return state->Deliver(slot_, choice_);
  }

 private:
  static std::string MakeName(std::size_t slot, std::size_t choice) {
    std::ostringstream ss;
    ss << "Deliver[" << slot << "]";
    if (choice != 0) ss << "/view" << choice;
    return ss.str();
  }

  std::size_t slot_;
  std::size_t choice_;
};

std::string SlotName(const char* what, std::size_t slot) {
  std::ostringstream ss;
  ss << what << "[" << slot << "]";
  return ss.str();
}

std::string ClientRuleName(const ClusterConfig& config, std::uint32_t client,
                           ClientAction action, std::size_t arg) {
  std::ostringstream ss;
  ss << "Client[" << client << "]." << action;
  if (action == ClientAction::Put || action == ClientAction::DeleteRange) {
    ss << "(" << config.kv_keys[arg] << ")";
  }
  return ss.str();
}

void RegisterNetworkRules(const ClusterConfig& config, TransitionSystem* ts) {
  for (std::size_t slot = 0; slot < config.net_capacity; ++slot) {
    for (std::size_t choice = 0; choice <= config.read_choices; ++choice) {
      ts->Make<DeliverRule>(slot, choice);
    }
  }

  if (config.faults.drops != 0) {
    for (std::size_t slot = 0; slot < config.net_capacity; ++slot) {
      ts->Make<core::RuleF<SystemState>>(
          SlotName("Drop", slot),
          [slot](const SystemState& state) {
            return state.network().CanDrop(slot);
          },
          [slot](SystemState* state) { return state->Drop(slot); });
    }
  }

  if (config.faults.duplicates != 0) {
    for (std::size_t slot = 0; slot < config.net_capacity; ++slot) {
      ts->Make<core::RuleF<SystemState>>(
          SlotName("Duplicate", slot),
          [slot](const SystemState& state) {
            return state.network().CanDuplicate(slot);
          },
          [slot](SystemState* state) { return state->Duplicate(slot); });
    }
  }

  if (config.faults.partitions != 0) {
    for (const auto kind : config.partition_groups) {
      const std::uint64_t group = config.GroupMask(kind);
      std::ostringstream partition, heal;
      partition << "Partition(" << kind << ")";
      heal << "Heal(" << kind << ")";

      ts->Make<core::RuleF<SystemState>>(
          partition.str(),
          [group](const SystemState& state) {
            return state.network().CanPartition(group);
          },
          [group](SystemState* state) { return state->Partition(group); });

      // Healing is not limited by the fault budget.
      ts->Make<core::RuleF<SystemState>>(
          heal.str(),
          [group](const SystemState& state) {
            return state.network().IsPartitioned(group);
          },
          [group](SystemState* state) { return state->Heal(group); });
    }
  }
}

void RegisterClientRules(const ClusterConfig& config, TransitionSystem* ts) {
  const ClientAction actions[] = {
      ClientAction::CreateDeployment, ClientAction::ScaleUp,
      ClientAction::ScaleDown,        ClientAction::CreatePod,
      ClientAction::DeletePod,        ClientAction::Put,
      ClientAction::Range,            ClientAction::DeleteRange};

  for (std::uint32_t client = 0; client < config.clients; ++client) {
    for (const auto action : actions) {
      std::size_t num_args = 1;
      if (action == ClientAction::Put || action == ClientAction::DeleteRange) {
        num_args = config.kv_keys.size();
      }

      for (std::size_t arg = 0; arg < num_args; ++arg) {
        ts->Make<core::RuleF<SystemState>>(
            ClientRuleName(config, client, action, arg),
            [client, action, arg](const SystemState& state) {
              return actor::Client::Enabled(state.config(),
                                            state.client(client), action, arg);
            },
            [client, action, arg](SystemState* state) {
              return state->ClientStep(client, action, arg);
            });
      }
    }
  }
}

}  // namespace

std::vector<actor::Node> BoundAllocations(const SystemState& state) {
  const auto& config = state.config();
  std::vector<actor::Node> nodes(config.nodes);
  for (std::uint32_t i = 0; i < config.nodes; ++i) {
    nodes[i].id = i + 1;
    nodes[i].capacity = config.node_capacity;
  }

  for (const auto& pod : state.datastore().Pods()) {
    if (!actor::IsBound(pod.phase)) continue;
    if (pod.node == 0 || pod.node > nodes.size()) continue;
    nodes[pod.node - 1].allocated += actor::PodRequest(pod.cpu, pod.mem);
  }

  return nodes;
}

bool NodeCapacityHolds(const SystemState& state) {
  for (const auto& node : BoundAllocations(state)) {
    if (node.OverCommitted()) return false;
  }
  return true;
}

bool SchedulerCapacityHolds(const SystemState& state) {
  for (std::size_t i = 0; i < state.num_schedulers(); ++i) {
    for (const auto& node : state.scheduler(i).nodes) {
      if (node.OverCommitted()) return false;
    }
  }
  return true;
}

bool RevisionsMonotonic(const SystemState& state) {
  const auto& ds = state.datastore();

  for (const auto& kv : ds.data) {
    actor::Revision prev = 0;
    for (const auto& version : kv.second) {
      if (version.revision <= prev || version.revision > ds.revision) {
        return false;
      }
      prev = version.revision;
    }
  }

  for (const auto& session : ds.sessions) {
    if (session.second > ds.revision) return false;
  }

  return ds.read_floor <= ds.revision;
}

bool PodsScheduled(const SystemState& state) {
  const auto nodes = BoundAllocations(state);

  for (const auto& pod : state.datastore().Pods()) {
    if (pod.phase != actor::PodPhase::Pending) continue;

    const auto request = actor::PodRequest(pod.cpu, pod.mem);
    for (const auto& node : nodes) {
      if (node.Fits(request)) return false;
    }
  }

  return true;
}

bool ReplicasetsConverged(const SystemState& state) {
  const auto& ds = state.datastore();

  std::map<actor::ReplicasetId, std::uint32_t> active;
  for (const auto& pod : ds.Pods()) {
    if (pod.owner != 0 && actor::IsActive(pod.phase)) {
      ++active[pod.owner];
    }
  }

  for (const auto& rs : ds.Replicasets()) {
    const auto it = active.find(rs.id);
    const std::uint32_t current = it != active.end() ? it->second : 0;
    if (current != rs.replicas) return false;
  }

  return true;
}

TransitionSystem MakeTransitionSystem(const ClusterConfig& config,
                                      const ModelOptions& options) {
  // Quiescent states have no successors; they complete a path.
  TransitionSystem ts(false);

  RegisterNetworkRules(config, &ts);
  RegisterClientRules(config, &ts);

  ts.Make<core::InvariantF<SystemState>>("NodeCapacity", NodeCapacityHolds);
  ts.Make<core::InvariantF<SystemState>>("SchedulerCapacity",
                                         SchedulerCapacityHolds);
  ts.Make<core::InvariantF<SystemState>>("RevisionMonotonic",
                                         RevisionsMonotonic);

  if (options.incremental_consistency) {
    const history::Checker checker(options.contract);
    std::ostringstream name;
    name << "Consistency(" << history::ContractName(options.contract) << ")";

    ts.Make<core::InvariantF<SystemState>>(
        name.str(), [checker](const SystemState& state) {
          return checker(state.history()).consistent;
        });
  }

  if (options.liveness) {
    ts.Make<core::Eventually<SystemState>>("PodsScheduled", PodsScheduled);
    ts.Make<core::Eventually<SystemState>>("ReplicasetsConverge",
                                           ReplicasetsConverged);
  }

  return ts;
}

}  // namespace system
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
