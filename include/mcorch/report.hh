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

#ifndef MCORCH_REPORT_HH_
#define MCORCH_REPORT_HH_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "mcorch/core/eval.hh"
#include "mcorch/history/checker.hh"

namespace mcorch {

/**
 * Results of one run, written as line-oriented CSV sections: summary,
 * discoveries, paths, runs. Each section starts with a "# <name>" line
 * followed by a header row.
 */
struct Report {
  struct Step {
    std::string rule;
    std::size_t state_hash;
  };

  struct Discovery {
    std::string property;
    std::vector<Step> steps;
  };

  struct PathVerdict {
    std::size_t operations;
    history::CheckResult result;
  };

  struct RunStat {
    std::size_t steps;
    double seconds;
    bool violated;
  };

  //! Number of paths found inconsistent.
  std::size_t num_inconsistent() const;

  void Write(std::ostream& os) const;

  /**
   * @throw std::runtime_error if the file cannot be written.
   */
  void WriteFile(const std::string& path) const;

  std::string model;
  std::string mode;
  std::string contract;
  core::Verdict verdict = core::Verdict::kVerified;
  std::size_t visited_states = 0;
  std::size_t queued_states = 0;
  std::size_t max_depth = 0;
  std::size_t truncated = 0;
  double seconds = 0;

  std::vector<Discovery> discoveries;
  std::vector<PathVerdict> paths;
  std::vector<RunStat> runs;
};

const char* VerdictName(core::Verdict verdict);

}  // namespace mcorch

#endif /* MCORCH_REPORT_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
