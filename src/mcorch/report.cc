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

#include "mcorch/report.hh"

#include <fstream>
#include <stdexcept>

namespace mcorch {

namespace {

// Quotes a field if it contains a separator or quote.
std::string Field(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) return s;

  std::string result = "\"";
  for (const char c : s) {
    if (c == '"') result += '"';
    result += c;
  }
  result += '"';
  return result;
}

}  // namespace

const char* VerdictName(core::Verdict verdict) {
  switch (verdict) {
    case core::Verdict::kVerified:
      return "verified";
    case core::Verdict::kViolated:
      return "violated";
    case core::Verdict::kInconclusive:
      return "inconclusive";
  }

  return "unknown";
}

std::size_t Report::num_inconsistent() const {
  std::size_t result = 0;
  for (const auto& path : paths) {
    if (!path.result.consistent) ++result;
  }
  return result;
}

void Report::Write(std::ostream& os) const {
  os << "# summary" << std::endl
     << "model,mode,contract,verdict,visited,queued,max_depth,truncated,"
        "seconds"
     << std::endl
     << Field(model) << "," << mode << "," << contract << ","
     << VerdictName(verdict) << "," << visited_states << "," << queued_states
     << "," << max_depth << "," << truncated << "," << seconds << std::endl;

  os << "# discoveries" << std::endl
     << "property,step,rule,state_hash" << std::endl;
  for (const auto& discovery : discoveries) {
    if (discovery.steps.empty()) {
      os << Field(discovery.property) << ",,," << std::endl;
    }
    for (std::size_t i = 0; i < discovery.steps.size(); ++i) {
      const auto& step = discovery.steps[i];
      os << Field(discovery.property) << "," << i << "," << Field(step.rule)
         << "," << step.state_hash << std::endl;
    }
  }

  os << "# paths" << std::endl
     << "path,operations,consistent,reason,conflict" << std::endl;
  for (std::size_t i = 0; i < paths.size(); ++i) {
    const auto& path = paths[i];
    std::string conflict;
    for (const auto op : path.result.conflict) {
      if (!conflict.empty()) conflict += ' ';
      conflict += std::to_string(op);
    }

    os << i << "," << path.operations << ","
       << (path.result.consistent ? 1 : 0) << "," << Field(path.result.reason)
       << "," << conflict << std::endl;
  }

  os << "# runs" << std::endl << "run,steps,seconds,violated" << std::endl;
  for (std::size_t i = 0; i < runs.size(); ++i) {
    os << i << "," << runs[i].steps << "," << runs[i].seconds << ","
       << (runs[i].violated ? 1 : 0) << std::endl;
  }
}

void Report::WriteFile(const std::string& path) const {
  std::ofstream ofs(path);
  if (!ofs) {
    throw std::runtime_error("cannot open report file: " + path);
  }

  Write(ofs);

  ofs.close();
  if (!ofs) {
    throw std::runtime_error("failed writing report file: " + path);
  }
}

}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
