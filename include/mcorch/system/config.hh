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

#ifndef MCORCH_SYSTEM_CONFIG_HH_
#define MCORCH_SYSTEM_CONFIG_HH_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "mcorch/actor/resources.hh"
#include "mcorch/actor/types.hh"
#include "mcorch/history/contract.hh"

namespace mcorch {
namespace system {

struct ConfigError : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

/**
 * Number of actions of each kind a client may still take.
 */
struct ClientBudget {
  struct Hash {
    std::size_t operator()(const ClientBudget& k) const {
      std::size_t h = 0;
      CombineHash(k.create_deployments, &h);
      CombineHash(k.scale_ups, &h);
      CombineHash(k.scale_downs, &h);
      CombineHash(k.create_pods, &h);
      CombineHash(k.delete_pods, &h);
      CombineHash(k.kv_puts, &h);
      CombineHash(k.kv_ranges, &h);
      CombineHash(k.kv_deletes, &h);
      return h;
    }
  };

  bool operator==(const ClientBudget& rhs) const {
    return create_deployments == rhs.create_deployments &&
           scale_ups == rhs.scale_ups && scale_downs == rhs.scale_downs &&
           create_pods == rhs.create_pods && delete_pods == rhs.delete_pods &&
           kv_puts == rhs.kv_puts && kv_ranges == rhs.kv_ranges &&
           kv_deletes == rhs.kv_deletes;
  }

  std::uint32_t create_deployments = 0;
  std::uint32_t scale_ups = 0;
  std::uint32_t scale_downs = 0;
  std::uint32_t create_pods = 0;
  std::uint32_t delete_pods = 0;
  std::uint32_t kv_puts = 0;
  std::uint32_t kv_ranges = 0;
  std::uint32_t kv_deletes = 0;
};

/**
 * Number of fault actions the network may still take on a path.
 */
struct FaultBudget {
  struct Hash {
    std::size_t operator()(const FaultBudget& k) const {
      std::size_t h = 0;
      CombineHash(k.drops, &h);
      CombineHash(k.duplicates, &h);
      CombineHash(k.partitions, &h);
      return h;
    }
  };

  bool operator==(const FaultBudget& rhs) const {
    return drops == rhs.drops && duplicates == rhs.duplicates &&
           partitions == rhs.partitions;
  }

  std::uint32_t drops = 0;
  std::uint32_t duplicates = 0;
  std::uint32_t partitions = 0;
};

/**
 * Shape of the modelled cluster, and the bounds of the model.
 *
 * Actor ids are laid out as: datastore, kubelet, schedulers, replicaset
 * controllers, clients.
 */
struct ClusterConfig {
  ClusterConfig();

  std::uint32_t num_actors() const {
    return 2 + schedulers + replicaset_controllers + clients;
  }

  actor::ActorId SchedulerId(std::uint32_t i) const { return 2 + i; }

  actor::ActorId ControllerId(std::uint32_t i) const {
    return 2 + schedulers + i;
  }

  actor::ActorId ClientId(std::uint32_t i) const {
    return 2 + schedulers + replicaset_controllers + i;
  }

  //! @throw std::out_of_range for an id not in the cluster.
  actor::ActorKind KindOf(actor::ActorId id) const;

  //! @return Index of the actor among the actors of its kind.
  std::uint32_t IndexOf(actor::ActorId id) const;

  std::vector<actor::ActorId> SchedulerIds() const;

  std::vector<actor::ActorId> ControllerIds() const;

  //! @return Bit mask of all actor ids of kind.
  std::uint64_t GroupMask(actor::ActorKind kind) const;

  //! Resources requested by every pod.
  actor::Resources pod_request() const {
    return actor::PodRequest(pod_cpu, pod_mem);
  }

  /**
   * @throw ConfigError if the configuration is not usable.
   */
  void Validate() const;

  std::uint32_t nodes = 1;
  actor::Resources node_capacity;
  std::uint32_t pod_cpu = 2;
  std::uint32_t pod_mem = 2;

  std::uint32_t schedulers = 1;
  std::uint32_t replicaset_controllers = 1;
  std::uint32_t clients = 1;

  std::uint32_t initial_replicasets = 0;
  std::uint32_t initial_replicas = 0;
  std::uint32_t initial_pods = 0;

  //! Scale of deployments created by clients.
  std::uint32_t deployment_replicas = 1;

  ClientBudget client_budget;
  FaultBudget faults;

  //! Actor groups that may be partitioned from the rest of the cluster.
  std::vector<actor::ActorKind> partition_groups;

  //! Maximum number of messages in flight; successors beyond are truncated.
  std::uint32_t net_capacity = 12;

  //! Maximum number of older views a read may be served from.
  std::uint32_t read_choices = 2;

  //! Contract the datastore serves reads with.
  history::Contract datastore_reads = history::Contract::Linearizable;

  //! Keys written by the client key-value workload.
  std::vector<std::string> kv_keys;
};

std::ostream& operator<<(std::ostream& os, const ClusterConfig& config);

}  // namespace system
}  // namespace mcorch

#endif /* MCORCH_SYSTEM_CONFIG_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
