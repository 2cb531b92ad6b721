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

#include "mcorch/system/config.hh"

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcorch {
namespace system {

using actor::ActorId;
using actor::ActorKind;

ClusterConfig::ClusterConfig() : kv_keys{"kv/a", "kv/b"} {
  node_capacity.cpu = 4;
  node_capacity.mem = 8;
  node_capacity.pods = 2;
}

ActorKind ClusterConfig::KindOf(ActorId id) const {
  if (id == actor::kDatastoreId) return ActorKind::Datastore;
  if (id == actor::kKubeletId) return ActorKind::Kubelet;
  if (id < ControllerId(0)) return ActorKind::Scheduler;
  if (id < ClientId(0)) return ActorKind::ReplicasetController;
  if (id < num_actors()) return ActorKind::Client;

  throw std::out_of_range("no actor with id " + std::to_string(id));
}

std::uint32_t ClusterConfig::IndexOf(ActorId id) const {
  switch (KindOf(id)) {
    case ActorKind::Datastore:
    case ActorKind::Kubelet:
      return 0;
    case ActorKind::Scheduler:
      return id - SchedulerId(0);
    case ActorKind::ReplicasetController:
      return id - ControllerId(0);
    case ActorKind::Client:
      return id - ClientId(0);
  }

  return 0;
}

std::vector<ActorId> ClusterConfig::SchedulerIds() const {
  std::vector<ActorId> result;
  for (std::uint32_t i = 0; i < schedulers; ++i) {
    result.push_back(SchedulerId(i));
  }
  return result;
}

std::vector<ActorId> ClusterConfig::ControllerIds() const {
  std::vector<ActorId> result;
  for (std::uint32_t i = 0; i < replicaset_controllers; ++i) {
    result.push_back(ControllerId(i));
  }
  return result;
}

std::uint64_t ClusterConfig::GroupMask(ActorKind kind) const {
  std::uint64_t mask = 0;
  for (ActorId id = 0; id < num_actors(); ++id) {
    if (KindOf(id) == kind) mask |= 1ULL << id;
  }
  return mask;
}

void ClusterConfig::Validate() const {
  if (nodes == 0 || nodes > 0xffff) {
    throw ConfigError("nodes must be in [1, 65535]");
  }

  if (num_actors() > 64) {
    throw ConfigError("at most 64 actors are supported, configured " +
                      std::to_string(num_actors()));
  }

  if (schedulers == 0 || replicaset_controllers == 0) {
    throw ConfigError("need at least one scheduler and one controller");
  }

  if (clients >= 100 || initial_replicasets >= 1000) {
    throw ConfigError("too many clients or initial replicasets");
  }

  if (initial_replicas > 0xffff || deployment_replicas > 0xffff ||
      initial_pods > 5000) {
    throw ConfigError("too many replicas or initial pods");
  }

  if (client_budget.create_pods >= 100 ||
      client_budget.create_deployments >= 100) {
    throw ConfigError("a client creates at most 99 pods and deployments");
  }

  if (net_capacity == 0) {
    throw ConfigError("net_capacity must be positive");
  }

  if (kv_keys.empty()) {
    throw ConfigError("need at least one key-value workload key");
  }

  for (const auto& key : kv_keys) {
    if (key.compare(0, std::string(actor::kKvPrefix).size(),
                    actor::kKvPrefix) != 0) {
      throw ConfigError("workload key '" + key + "' must start with " +
                        actor::kKvPrefix);
    }
  }

  for (const auto kind : partition_groups) {
    if (GroupMask(kind) == 0) {
      throw ConfigError("cannot partition empty actor group");
    }
  }
}

std::ostream& operator<<(std::ostream& os, const ClusterConfig& config) {
  os << "nodes=" << config.nodes << " (" << config.node_capacity << ")"
     << " pod=" << config.pod_cpu << "/" << config.pod_mem
     << " schedulers=" << config.schedulers
     << " controllers=" << config.replicaset_controllers
     << " clients=" << config.clients
     << " replicasets=" << config.initial_replicasets << "x"
     << config.initial_replicas << " pods=" << config.initial_pods
     << " faults=" << config.faults.drops << "/" << config.faults.duplicates
     << "/" << config.faults.partitions
     << " reads=" << history::ContractName(config.datastore_reads);
  return os;
}

}  // namespace system
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
