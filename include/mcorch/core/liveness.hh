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

#ifndef MCORCH_CORE_LIVENESS_HH_
#define MCORCH_CORE_LIVENESS_HH_

#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "mcorch/debug.hh"
#include "mcorch/io.hh"
#include "ts.hh"
#include "types.hh"

namespace mcorch {
namespace core {

/**
 * Liveness property "eventually goal".
 *
 * Assuming fairness (an action that stays enabled is eventually taken), goal
 * is violated if either:
 *
 *  1. a state that does not satisfy goal has no successors: the system is
 *     stuck; reported immediately as LivenessViolation on the current path;
 *
 *  2. the graph of transitions between states not satisfying goal contains a
 *     cycle: the system may loop forever without progress [1]. The graph is
 *     recorded in Next and checked in IsSatisfied.
 *
 * [1] <a href="http://www.kenmcmil.com/pubs/ISSMM91.pdf"> Kenneth L. McMillan,
 *      J. Schwalbe, "Formal verification of the Gigamax cache consistency
 *      protocol" ISSM. 1991</a>
 */
template <class State>
class Eventually : public Property<State> {
 public:
  explicit Eventually(std::string name, std::function<bool(const State&)> goal)
      : Property<State>(std::move(name)), goal_(std::move(goal)) {}

  void Reset() override {
    state_graph_.Clear();
    edge_rules_.clear();
  }

  void Next(const State& state, const StateMap<State>& next_states,
            const RuleNames<State>& rule_names) override {
    if (goal_(state)) return;

    if (next_states.empty()) {
      throw LivenessViolation(this->name());
    }

    const auto hash = GetHash(state);
    for (const auto& kv : next_states) {
      if (!goal_(kv.second)) {
        state_graph_.Insert(hash, kv.first);

        auto rule = rule_names.find(kv.first);
        if (rule != rule_names.end()) {
          edge_rules_.emplace(std::make_pair(hash, kv.first), rule->second);
        }
      }
    }
  }

  bool IsSatisfied(bool verbose_on_error = true) const override {
    const auto cycle = Cycle();
    if (cycle.empty()) return true;

    if (verbose_on_error) {
      std::cout << std::endl;
      PrintTraceDiff(
          cycle,
          [](const std::pair<StateHash<State>, std::string>& step,
             std::ostream& os) { os << "state " << step.first << std::endl; },
          [](const std::pair<StateHash<State>, std::string>& step,
             std::ostream& os) {
            os << kColGRN << "================> " << step.second << kColRst
               << std::endl;
          },
          std::cout);

      std::cout << kColRED << "===> VERIFICATION FAILED (" << cycle.size()
                << " steps): " << this->name() << " (cycle without progress)"
                << kColRst << std::endl;
      std::cout << std::endl;
    }
    return false;
  }

  /**
   * The cycle closes with the last state's rule leading back to the first
   * state.
   */
  std::vector<std::pair<StateHash<State>, std::string>> Cycle() const override {
    typename Relation<StateHash<State>>::Path path;
    if (state_graph_.Acyclic(&path)) return {};

    if (path.size() > 1 && path.front() == path.back()) {
      path.pop_back();
    }

    std::vector<std::pair<StateHash<State>, std::string>> cycle;
    cycle.reserve(path.size());
    for (std::size_t i = 0; i < path.size(); ++i) {
      const auto edge = std::make_pair(path[i], path[(i + 1) % path.size()]);
      auto rule = edge_rules_.find(edge);
      cycle.emplace_back(path[i],
                         rule != edge_rules_.end() ? rule->second : "");
    }
    return cycle;
  }

 private:
  std::function<bool(const State&)> goal_;
  Relation<StateHash<State>> state_graph_;
  std::map<std::pair<StateHash<State>, StateHash<State>>, std::string>
      edge_rules_;
};

}  // namespace core
}  // namespace mcorch

#endif /* MCORCH_CORE_LIVENESS_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
