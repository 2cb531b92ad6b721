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

#ifndef MCORCH_CORE_SIMULATION_HH_
#define MCORCH_CORE_SIMULATION_HH_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <gsl/gsl>

#include "eval.hh"
#include "model_checking.hh"
#include "ts.hh"

namespace mcorch {
namespace core {

/**
 * Randomized simulation.
 *
 * Performs independent rollouts of bounded length from the start states
 * (round-robin); at each step one successor is sampled uniformly with a seeded
 * generator. No global set of visited states is kept. The final state of each
 * rollout is returned as accepting (it completes a path), regardless of
 * State::Accept().
 */
template <class TransitionSystemT>
class Eval_Simulation : public EvalBase<TransitionSystemT> {
 public:
  using typename EvalBase<TransitionSystemT>::TransitionSystem;
  using typename EvalBase<TransitionSystemT>::State;
  using typename EvalBase<TransitionSystemT>::Trace;

  struct RunStats {
    std::size_t steps;
    double seconds;
    bool violated;
  };

  explicit Eval_Simulation(std::uint64_t seed = 0, std::size_t runs = 100)
      : seed_(seed), runs_(runs), rng_(seed) {
    this->max_depth_ = 100;
  }

  const char* name() const override { return "Eval_Simulation"; }

  void Reset() override {
    EvalBase<TransitionSystemT>::Reset();
    rng_.seed(seed_);
    run_stats_.clear();
  }

  StateQueue<State> Evaluate(const StateQueue<State>& start_states,
                             TransitionSystem* ts) override {
    Expects(!start_states.empty());
    Expects(this->max_depth() != 0);
    Expects(run_stats_.empty());

    StateQueue<State> result;
    auto start = start_states.begin();

    for (std::size_t run = 0; run < runs_ && this->monitor(&result); ++run) {
      if (start == start_states.end()) start = start_states.begin();
      result.push_back(Rollout(*start++, ts));
    }

    return result;
  }

  std::uint64_t seed() const { return seed_; }

  std::size_t runs() const { return runs_; }

  void set_runs(std::size_t v) { runs_ = v; }

  const std::vector<RunStats>& run_stats() const { return run_stats_; }

 private:
  State Rollout(const State& start, TransitionSystem* ts) {
    const auto begin = std::chrono::steady_clock::now();
    Trace path;
    State state = start;
    bool violated = false;

    try {
      for (;;) {
        if (this->AtDepthBound(path.size())) {
          ts->CheckInvariants(state);
          ++this->num_visited_states_;
          break;
        }

        auto successors = detail::OrderedSuccessors(state, ts);
        ++this->num_visited_states_;

        if (successors.empty()) break;

        std::uniform_int_distribution<std::size_t> pick(
            0, successors.size() - 1);
        auto& chosen = successors[pick(rng_)];

        path.emplace_back(std::move(state), std::move(chosen.first));
        state = std::move(chosen.second);
      }
    } catch (const Error& error) {
      violated = true;
      path.emplace_back(state, "");
      this->RecordViolation(error, std::move(path));
    }

    this->UpdateMaxDepth(path.size());

    const std::chrono::duration<double> elapsed =
        std::chrono::steady_clock::now() - begin;
    run_stats_.push_back(RunStats{path.size(), elapsed.count(), violated});

    return state;
  }

  std::uint64_t seed_;
  std::size_t runs_;
  std::mt19937_64 rng_;
  std::vector<RunStats> run_stats_;
};

}  // namespace core
}  // namespace mcorch

#endif /* MCORCH_CORE_SIMULATION_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
