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

#ifndef MCORCH_CONFIG_HH_
#define MCORCH_CONFIG_HH_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include <gflags/gflags.h>

#include "mcorch/history/contract.hh"
#include "mcorch/system/config.hh"
#include "mcorch/util.hh"

DECLARE_string(check_mode);
DECLARE_string(consistency);
DECLARE_string(datastore_reads);
DECLARE_string(report_path);
DECLARE_uint64(max_depth);
DECLARE_uint64(max_states);
DECLARE_uint64(sim_runs);
DECLARE_uint64(seed);
DECLARE_bool(stop_on_violation);
DECLARE_bool(incremental_consistency);
DECLARE_bool(liveness);

namespace mcorch {

PRINTABLE_ENUM_CLASS(CheckMode, inline, dfs, bfs, simulation);

//! @throw system::ConfigError unless name is one of dfs, bfs, simulation.
CheckMode ParseCheckMode(const std::string& name);

/**
 * Options of one run of the model checker, validated from the command line
 * flags.
 */
struct RunConfig {
  /**
   * @throw system::ConfigError on an unknown mode or contract.
   */
  static RunConfig FromFlags();

  /**
   * Applies the datastore read contract and the cluster shape overrides given
   * on the command line, and validates the result.
   *
   * @throw system::ConfigError if the resulting cluster is not usable.
   */
  void ApplyTo(system::ClusterConfig* cluster) const;

  CheckMode check_mode = CheckMode::dfs;
  history::Contract consistency = history::Contract::Linearizable;
  history::Contract datastore_reads = history::Contract::Linearizable;
  std::string report_path;

  //! 0 means unbounded; simulation uses it as the rollout length.
  std::size_t max_depth = 0;
  std::size_t max_states = 0;
  std::size_t sim_runs = 100;
  std::uint64_t seed = 0;

  bool stop_on_violation = false;
  bool incremental_consistency = false;
  bool liveness = true;
};

std::ostream& operator<<(std::ostream& os, const RunConfig& config);

}  // namespace mcorch

#endif /* MCORCH_CONFIG_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
