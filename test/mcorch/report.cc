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
#include "mcorch/report.hh"

#include <sstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

using namespace mcorch;

namespace {

Report Sample() {
  Report report;
  report.model = "cluster";
  report.mode = "dfs";
  report.contract = "linearizable";
  report.verdict = core::Verdict::kViolated;
  report.visited_states = 10;

  Report::Discovery discovery;
  discovery.property = "NodeCapacity";
  discovery.steps.push_back(Report::Step{"", 1});
  discovery.steps.push_back(Report::Step{"Deliver[0]", 2});
  report.discoveries.push_back(discovery);

  history::CheckResult bad;
  bad.consistent = false;
  bad.reason = "stale read, expected \"x\"";
  bad.conflict = {2, 5};
  report.paths.push_back(Report::PathVerdict{3, history::CheckResult()});
  report.paths.push_back(Report::PathVerdict{4, bad});
  return report;
}

}  // namespace

TEST(Report, Sections) {
  const auto report = Sample();
  ASSERT_EQ(1U, report.num_inconsistent());

  std::ostringstream oss;
  report.Write(oss);
  const auto csv = oss.str();

  ASSERT_EQ(0U, csv.find("# summary\n"));
  ASSERT_NE(std::string::npos,
            csv.find("cluster,dfs,linearizable,violated,10,"));
  ASSERT_NE(std::string::npos, csv.find("NodeCapacity,1,Deliver[0],2\n"));
  ASSERT_NE(std::string::npos, csv.find("0,3,1,,\n"));
  ASSERT_NE(std::string::npos,
            csv.find("1,4,0,\"stale read, expected \"\"x\"\"\",2 5\n"));
  ASSERT_NE(std::string::npos, csv.find("# runs\nrun,steps,seconds,violated"));
}

TEST(Report, CycleDiscovery) {
  Report report;
  report.verdict = core::Verdict::kViolated;

  Report::Discovery cycle;
  cycle.property = "PodsScheduled";
  cycle.steps.push_back(Report::Step{"Deliver[0]", 7});
  cycle.steps.push_back(Report::Step{"Deliver[1]", 9});
  report.discoveries.push_back(cycle);

  Report::Discovery bare;
  bare.property = "ReplicasConverge";
  report.discoveries.push_back(bare);

  std::ostringstream oss;
  report.Write(oss);
  const auto csv = oss.str();

  ASSERT_NE(std::string::npos, csv.find("PodsScheduled,0,Deliver[0],7\n"
                                        "PodsScheduled,1,Deliver[1],9\n"));
  ASSERT_NE(std::string::npos, csv.find("ReplicasConverge,,,\n"));
}

TEST(Report, UnwritableFile) {
  ASSERT_THROW(Sample().WriteFile("/nonexistent/dir/report.csv"),
               std::runtime_error);
}

TEST(Report, VerdictName) {
  ASSERT_STREQ("verified", VerdictName(core::Verdict::kVerified));
  ASSERT_STREQ("inconclusive", VerdictName(core::Verdict::kInconclusive));
}

/* vim: set ts=2 sts=2 sw=2 et : */
