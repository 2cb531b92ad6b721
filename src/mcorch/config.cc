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

#include "mcorch/config.hh"

#include <stdexcept>

#include <gflags/gflags.h>

DEFINE_string(check_mode, gflags::StringFromEnv("MCORCH_CHECK_MODE", "dfs"),
              "Search strategy: dfs, bfs or simulation");

DEFINE_string(consistency,
              gflags::StringFromEnv("MCORCH_CONSISTENCY", "linearizable"),
              "Contract the key-value history is checked against: "
              "linearizable, session or monotonic-session");

DEFINE_string(datastore_reads,
              gflags::StringFromEnv("MCORCH_DATASTORE_READS", ""),
              "Contract the datastore serves reads with; empty: same as "
              "--consistency");

DEFINE_string(report_path, gflags::StringFromEnv("MCORCH_REPORT", ""),
              "Write the CSV report to this file");

DEFINE_uint64(max_depth, 0,
              "Depth bound of the search, 0 for unbounded; in simulation mode "
              "the rollout length (0: 100)");

DEFINE_uint64(max_states, 0,
              "Stop after this many visited states, 0 for unbounded");

DEFINE_uint64(sim_runs, 100, "Number of rollouts in simulation mode");

DEFINE_uint64(seed, 0, "Seed of the simulation");

DEFINE_bool(stop_on_violation, false,
            "Stop at the first violation instead of collecting the shortest "
            "counterexample per property");

DEFINE_bool(incremental_consistency, false,
            "Check consistency at every state, not only on completed paths");

DEFINE_bool(liveness, true, "Check the liveness properties");

// Cluster shape overrides; negative keeps the model's value.
DEFINE_int32(nodes, -1, "Number of nodes");
DEFINE_int32(schedulers, -1, "Number of schedulers");
DEFINE_int32(drops, -1, "Message drop budget");
DEFINE_int32(duplicates, -1, "Message duplication budget");
DEFINE_int32(partitions, -1, "Partition budget");
DEFINE_int32(net_capacity, -1, "Maximum number of messages in flight");
DEFINE_int32(read_choices, -1, "Maximum number of older views per read");

namespace mcorch {

namespace {

history::Contract ContractFromFlag(const char* flag, const std::string& name) {
  try {
    return history::ParseContract(name);
  } catch (const std::invalid_argument&) {
    throw system::ConfigError(std::string("--") + flag +
                              ": unknown contract '" + name + "'");
  }
}

void Override(std::int32_t flag, std::uint32_t* value) {
  if (flag >= 0) *value = static_cast<std::uint32_t>(flag);
}

}  // namespace

CheckMode ParseCheckMode(const std::string& name) {
  if (name == "dfs") return CheckMode::dfs;
  if (name == "bfs") return CheckMode::bfs;
  if (name == "simulation") return CheckMode::simulation;

  throw system::ConfigError("--check_mode: unknown mode '" + name + "'");
}

RunConfig RunConfig::FromFlags() {
  RunConfig config;
  config.check_mode = ParseCheckMode(FLAGS_check_mode);
  config.consistency = ContractFromFlag("consistency", FLAGS_consistency);
  config.datastore_reads =
      FLAGS_datastore_reads.empty()
          ? config.consistency
          : ContractFromFlag("datastore_reads", FLAGS_datastore_reads);
  config.report_path = FLAGS_report_path;
  config.max_depth = FLAGS_max_depth;
  config.max_states = FLAGS_max_states;
  config.sim_runs = FLAGS_sim_runs;
  config.seed = FLAGS_seed;
  config.stop_on_violation = FLAGS_stop_on_violation;
  config.incremental_consistency = FLAGS_incremental_consistency;
  config.liveness = FLAGS_liveness;

  if (config.check_mode == CheckMode::simulation) {
    if (config.sim_runs == 0) {
      throw system::ConfigError("--sim_runs must be positive");
    }

    if (config.max_depth == 0) config.max_depth = 100;
  }

  return config;
}

void RunConfig::ApplyTo(system::ClusterConfig* cluster) const {
  cluster->datastore_reads = datastore_reads;

  Override(FLAGS_nodes, &cluster->nodes);
  Override(FLAGS_schedulers, &cluster->schedulers);
  Override(FLAGS_drops, &cluster->faults.drops);
  Override(FLAGS_duplicates, &cluster->faults.duplicates);
  Override(FLAGS_partitions, &cluster->faults.partitions);
  Override(FLAGS_net_capacity, &cluster->net_capacity);
  Override(FLAGS_read_choices, &cluster->read_choices);

  cluster->Validate();
}

std::ostream& operator<<(std::ostream& os, const RunConfig& config) {
  os << "mode=" << config.check_mode
     << " consistency=" << history::ContractName(config.consistency)
     << " max_depth=" << config.max_depth
     << " max_states=" << config.max_states;
  if (config.check_mode == CheckMode::simulation) {
    os << " runs=" << config.sim_runs << " seed=" << config.seed;
  }
  return os;
}

}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
