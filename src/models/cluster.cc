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

#include "main.hh"

#include "mcorch/actor/types.hh"
#include "mcorch/system/config.hh"

using mcorch::actor::ActorKind;
using mcorch::system::ClusterConfig;

namespace models {

/**
 * Full control plane on two nodes: an initial replicaset plus a client that
 * creates and scales a deployment, creates and deletes a pod, and reads and
 * writes keys.
 */
int Main_cluster(int argc, char* argv[]) {
  ClusterConfig config;
  config.nodes = 2;
  config.initial_replicasets = 1;
  config.initial_replicas = 1;
  config.client_budget.create_deployments = 1;
  config.client_budget.scale_ups = 1;
  config.client_budget.create_pods = 1;
  config.client_budget.delete_pods = 1;
  config.client_budget.kv_puts = 1;
  config.client_budget.kv_ranges = 1;
  config.faults.drops = 1;
  return RunCluster("cluster", config);
}

/**
 * Two schedulers with independent views of one node with room for a single
 * pod. Both may place different pods on the node at once: the node capacity
 * invariant is expected to fail.
 */
int Main_scheduling(int argc, char* argv[]) {
  ClusterConfig config;
  config.node_capacity.pods = 1;
  config.schedulers = 2;
  config.client_budget.create_pods = 2;
  return RunCluster("scheduling", config);
}

/**
 * Convergence of an initial replicaset and a client deployment that is scaled
 * up and down, under a lost message and a partitioned controller.
 */
int Main_reconcile(int argc, char* argv[]) {
  ClusterConfig config;
  config.nodes = 2;
  config.initial_replicasets = 1;
  config.initial_replicas = 2;
  config.client_budget.create_deployments = 1;
  config.client_budget.scale_ups = 1;
  config.client_budget.scale_downs = 1;
  config.faults.drops = 1;
  config.faults.partitions = 1;
  config.partition_groups.push_back(ActorKind::ReplicasetController);
  return RunCluster("reconcile", config);
}

/**
 * Key-value workload of two clients; the history is checked against
 * --consistency while the datastore serves reads per --datastore_reads.
 */
int Main_register(int argc, char* argv[]) {
  ClusterConfig config;
  config.clients = 2;
  config.kv_keys = {"kv/x"};
  config.client_budget.kv_puts = 1;
  config.client_budget.kv_ranges = 2;
  config.faults.partitions = 1;
  config.partition_groups.push_back(ActorKind::Datastore);
  return RunCluster("register", config);
}

}  // namespace models

/* vim: set ts=2 sts=2 sw=2 et : */
