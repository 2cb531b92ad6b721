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

#ifndef MCORCH_COMMAND_HH_
#define MCORCH_COMMAND_HH_

#include <chrono>
#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <new>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <glog/logging.h>

#include "mcorch/config.hh"
#include "mcorch/core/model_checking.hh"
#include "mcorch/core/simulation.hh"
#include "mcorch/debug.hh"
#include "mcorch/io.hh"
#include "mcorch/report.hh"

namespace mcorch {

// PrintErrorTrace is part of the command-line interface (write to std::cout),
// hence it is in this header, and not debug.hh.
template <class TransitionSystem>
inline void PrintErrorTrace(
    const typename core::EvalBase<TransitionSystem>::ErrorTrace& trace,
    std::size_t num_visited_states) {
  using StateRule =
      typename core::EvalBase<TransitionSystem>::Trace::value_type;

  std::cout << std::endl;
  PrintTraceDiff(trace.trace(),
                 [](const StateRule& state_rule, std::ostream& os) {
                   os << state_rule.first;
                 },
                 [](const StateRule& state_rule, std::ostream& os) {
                   if (!state_rule.second.empty()) {
                     os << kColGRN << "================( " << state_rule.second
                        << " )===>" << kColRst << std::endl;
                   }
                 },
                 std::cout);

  std::cout << kColRED << "===> VERIFICATION FAILED (" << trace.trace().size()
            << " steps): " << trace.error().what()
            << " | visited states: " << num_visited_states << kColRst
            << std::endl;
  std::cout << std::endl;
}

/**
 * Runs one model with the backend selected by RunConfig, checks every
 * completed path with the path check (if set), prints the outcome and writes
 * the report.
 *
 * Exit codes: 0 verified, 1 violated, 2 report not writable, 42 out of memory
 * or state limit reached.
 */
template <class TransitionSystem>
class ModelCheckerCommand {
 public:
  typedef core::EvalBase<TransitionSystem> EvalBase;
  typedef typename TransitionSystem::State State;
  typedef std::function<Report::PathVerdict(const State&)> PathCheck;

  explicit ModelCheckerCommand(RunConfig config, std::string model)
      : config_(std::move(config)) {
    report_.model = std::move(model);
    report_.contract = history::ContractName(config_.consistency);

    std::ostringstream mode;
    mode << config_.check_mode;
    report_.mode = mode.str();

    switch (config_.check_mode) {
      case CheckMode::bfs:
        eval_.reset(new core::Eval_BFS<TransitionSystem>());
        break;
      case CheckMode::simulation:
        sim_ = new core::Eval_Simulation<TransitionSystem>(config_.seed,
                                                           config_.sim_runs);
        eval_.reset(sim_);
        break;
      case CheckMode::dfs:
        eval_.reset(new core::Eval_DFS<TransitionSystem>());
        break;
    }

    InfoOut() << "Instantiating evaluation backend: " << eval_->name()
              << std::endl;

    eval_->set_max_depth(config_.max_depth);
    eval_->set_max_states(config_.max_states);
    eval_->set_stop_on_violation(config_.stop_on_violation);

    eval_->set_monitor([this, count = 0](
        const EvalBase& mc, core::StateQueue<State>* accept) mutable {
      if (count++ % 10000 == 0) {
        std::cout << "... visited states: " << mc.num_visited_states()
                  << " | queued: " << mc.num_queued_states() << std::endl;
      }
      CheckPaths(accept);
      return true;
    });
  }

  ModelCheckerCommand(const ModelCheckerCommand&) = delete;

  ModelCheckerCommand& operator=(const ModelCheckerCommand&) = delete;

  void set_path_check(PathCheck check) { path_check_ = std::move(check); }

  int operator()(const core::StateQueue<State>& start_states,
                 TransitionSystem* ts) {
    const auto begin = std::chrono::steady_clock::now();

    try {
      auto accept = eval_->Evaluate(start_states, ts);
      CheckPaths(&accept);
    } catch (const typename EvalBase::ErrorTrace& trace) {
      PrintErrorTrace<TransitionSystem>(trace, eval_->num_visited_states());
      AddDiscovery(trace);
      return Finish(core::Verdict::kViolated, 1, ts, begin);
    } catch (const std::bad_alloc& e) {
      ErrOut() << "Out of memory!" << std::endl;
      WarnOut() << "Inconclusive: retry with --check_mode=simulation or "
                   "tighter bounds."
                << std::endl;
      return Finish(core::Verdict::kInconclusive, 42, ts, begin);
    }

    bool violated = false;
    for (const auto& discovery : eval_->discoveries()) {
      PrintErrorTrace<TransitionSystem>(discovery.second,
                                        eval_->num_visited_states());
      AddDiscovery(discovery.second);
      violated = true;
    }

    for (const auto& prop : ts->properties()) {
      if (!prop->IsSatisfied(eval_->verbose_on_error())) {
        Report::Discovery discovery;
        discovery.property = prop->name();
        for (const auto& step : prop->Cycle()) {
          discovery.steps.push_back(Report::Step{step.second, step.first});
        }
        report_.discoveries.push_back(std::move(discovery));
        violated = true;
      }
    }

    if (report_.num_inconsistent() != 0) {
      std::cout << kColRED << "===> VERIFICATION FAILED: "
                << report_.num_inconsistent() << " of " << report_.paths.size()
                << " paths not " << report_.contract << kColRst << std::endl;
      violated = true;
    }

    if (violated) {
      return Finish(core::Verdict::kViolated, 1, ts, begin);
    }

    if (eval_->exhausted()) {
      WarnOut() << "State limit reached after "
                << eval_->num_visited_states()
                << " states; inconclusive: retry with "
                   "--check_mode=simulation or tighter bounds."
                << std::endl;
      return Finish(core::Verdict::kInconclusive, 42, ts, begin);
    }

    std::cout << kColBLU << ">> VERIFIED | "
              << "visited states: " << eval_->num_visited_states()
              << " | paths: " << report_.paths.size();
    if (sim_ != nullptr) {
      std::cout << " (" << sim_->runs() << " rollouts, no violation)";
    }
    std::cout << kColRst << std::endl;

    return Finish(core::Verdict::kVerified, 0, ts, begin);
  }

  EvalBase& eval() { return *eval_; }

  const EvalBase& eval() const { return *eval_; }

  const Report& report() const { return report_; }

 private:
  void CheckPaths(core::StateQueue<State>* accept) {
    if (path_check_) {
      for (const auto& state : *accept) {
        report_.paths.push_back(path_check_(state));

        const auto& verdict = report_.paths.back();
        if (!verdict.result.consistent && report_.num_inconsistent() == 1) {
          std::cout << std::endl << state << std::endl;
          std::cout << kColRED << "===> INCONSISTENT PATH: " << verdict.result
                    << kColRst << std::endl;
        }
      }
    }

    accept->clear();
  }

  void AddDiscovery(const typename EvalBase::ErrorTrace& trace) {
    Report::Discovery discovery;
    discovery.property = trace.error().what();
    for (const auto& step : trace.trace()) {
      discovery.steps.push_back(
          Report::Step{step.second, core::GetHash(step.first)});
    }
    report_.discoveries.push_back(std::move(discovery));
  }

  int Finish(core::Verdict verdict, int status, const TransitionSystem* ts,
             std::chrono::steady_clock::time_point begin) {
    const std::chrono::duration<double> elapsed =
        std::chrono::steady_clock::now() - begin;

    report_.verdict = verdict;
    report_.visited_states = eval_->num_visited_states();
    report_.queued_states = eval_->num_queued_states();
    report_.max_depth = eval_->max_reached_depth();
    report_.truncated = ts->num_truncated();
    report_.seconds = elapsed.count();

    if (sim_ != nullptr) {
      for (const auto& run : sim_->run_stats()) {
        report_.runs.push_back(
            Report::RunStat{run.steps, run.seconds, run.violated});
      }
    }

    if (report_.truncated != 0) {
      InfoOut() << report_.truncated
                << " successors exceeded the network capacity" << std::endl;
    }

    if (!config_.report_path.empty()) {
      try {
        report_.WriteFile(config_.report_path);
        InfoOut() << "Wrote report: " << config_.report_path << std::endl;
      } catch (const std::runtime_error& e) {
        LOG(ERROR) << e.what();
        return 2;
      }
    }

    return status;
  }

  RunConfig config_;
  std::unique_ptr<EvalBase> eval_;

  // Owned by eval_; set in simulation mode.
  core::Eval_Simulation<TransitionSystem>* sim_ = nullptr;

  PathCheck path_check_;
  Report report_;
};

}  // namespace mcorch

#endif /* MCORCH_COMMAND_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
