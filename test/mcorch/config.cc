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

// Include tested header first, to assert it includes required headers itself!
#include "mcorch/config.hh"

#include <gflags/gflags.h>
#include <gtest/gtest.h>

DECLARE_int32(nodes);

using namespace mcorch;

TEST(RunConfig, ParseCheckMode) {
  ASSERT_EQ(CheckMode::dfs, ParseCheckMode("dfs"));
  ASSERT_EQ(CheckMode::bfs, ParseCheckMode("bfs"));
  ASSERT_EQ(CheckMode::simulation, ParseCheckMode("simulation"));
  ASSERT_THROW(ParseCheckMode("random"), system::ConfigError);
}

TEST(RunConfig, Defaults) {
  gflags::FlagSaver saver;

  const auto config = RunConfig::FromFlags();
  ASSERT_EQ(CheckMode::dfs, config.check_mode);
  ASSERT_EQ(history::Contract::Linearizable, config.consistency);
  ASSERT_EQ(history::Contract::Linearizable, config.datastore_reads);
  ASSERT_EQ(0U, config.max_depth);
  ASSERT_TRUE(config.liveness);
}

TEST(RunConfig, DatastoreReadsFollowConsistency) {
  gflags::FlagSaver saver;
  FLAGS_consistency = "session";

  auto config = RunConfig::FromFlags();
  ASSERT_EQ(history::Contract::Session, config.datastore_reads);

  FLAGS_datastore_reads = "linearizable";
  config = RunConfig::FromFlags();
  ASSERT_EQ(history::Contract::Session, config.consistency);
  ASSERT_EQ(history::Contract::Linearizable, config.datastore_reads);
}

TEST(RunConfig, UnknownContract) {
  gflags::FlagSaver saver;
  FLAGS_consistency = "eventual";
  ASSERT_THROW(RunConfig::FromFlags(), system::ConfigError);
}

TEST(RunConfig, SimulationDefaults) {
  gflags::FlagSaver saver;
  FLAGS_check_mode = "simulation";

  auto config = RunConfig::FromFlags();
  ASSERT_EQ(100U, config.max_depth);

  FLAGS_sim_runs = 0;
  ASSERT_THROW(RunConfig::FromFlags(), system::ConfigError);
}

TEST(RunConfig, ApplyOverrides) {
  gflags::FlagSaver saver;
  FLAGS_nodes = 3;
  FLAGS_datastore_reads = "monotonic-session";

  system::ClusterConfig cluster;
  cluster.faults.drops = 2;
  RunConfig::FromFlags().ApplyTo(&cluster);

  ASSERT_EQ(3U, cluster.nodes);
  ASSERT_EQ(2U, cluster.faults.drops);
  ASSERT_EQ(history::Contract::MonotonicSession, cluster.datastore_reads);
}

TEST(RunConfig, ApplyValidates) {
  gflags::FlagSaver saver;
  FLAGS_nodes = 0;

  system::ClusterConfig cluster;
  ASSERT_THROW(RunConfig::FromFlags().ApplyTo(&cluster), system::ConfigError);
}

/* vim: set ts=2 sts=2 sw=2 et : */
