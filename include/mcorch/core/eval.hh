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

#ifndef MCORCH_CORE_EVAL_HH_
#define MCORCH_CORE_EVAL_HH_

#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gsl/gsl>

#include "mcorch/util.hh"
#include "ts.hh"

namespace mcorch {
namespace core {

PRINTABLE_ENUM_CLASS(Verdict, inline, kVerified, kViolated, kInconclusive);

template <class TransitionSystemT>
class EvalBase {
 public:
  using TransitionSystem = TransitionSystemT;
  using State = typename TransitionSystemT::State;

  /**
   * HashTrace is a sequences of state hashes ordered from last state to
   * initial state.
   */
  using HashTrace = std::vector<StateHash<State>>;

  /**
   * Trace is a sequence of full state-action pairs from initial state to last
   * state. The action of the last state is empty.
   */
  using Trace = std::vector<std::pair<State, std::string>>;

  class ErrorTrace : public std::exception {
   public:
    explicit ErrorTrace(Error error, Trace trace)
        : error_(std::move(error)), trace_(std::move(trace)) {}

    const Error& error() const { return error_; }
    const Trace& trace() const { return trace_; }

    const char* what() const noexcept override { return error_.what(); }

   private:
    Error error_;
    Trace trace_;
  };

  /**
   * Shortest counterexample found per violated property, keyed by the
   * property (error) name.
   */
  using Discoveries = std::map<std::string, ErrorTrace>;

  explicit EvalBase(bool verbose_on_error = true)
      : verbose_on_error_(verbose_on_error) {}

  virtual ~EvalBase() = default;

  virtual void Reset() {
    num_visited_states_ = 0;
    num_queued_states_ = 0;
    max_reached_depth_ = 0;
    exhausted_ = false;
    discoveries_.clear();
  }

  /**
   * Searches the state-space. Returns the set of accepting states: the
   * implementation of this function shall use a function State::Accept() to
   * query if a state is accepting.
   *
   * If stop_on_violation() is set, the first violation is thrown as
   * ErrorTrace; otherwise the violating branch is pruned, the shortest trace
   * per property is kept in discoveries(), and the search continues.
   *
   * @param start_states The initial States.
   * @param ts The TransitionSystem.
   * @return Queue of accepting states, in order encountered.
   */
  virtual StateQueue<State> Evaluate(const StateQueue<State>& start_states,
                                     TransitionSystem* ts) = 0;

  virtual const char* name() const { return "EvalBase"; }

  /**
   * Verdict of the last Evaluate, not including properties that are only
   * checked via Property::IsSatisfied.
   */
  Verdict verdict() const {
    if (!discoveries_.empty()) return Verdict::kViolated;
    if (exhausted_) return Verdict::kInconclusive;
    return Verdict::kVerified;
  }

  bool verbose_on_error() const { return verbose_on_error_; }

  void set_verbose_on_error(bool v) { verbose_on_error_ = v; }

  bool stop_on_violation() const { return stop_on_violation_; }

  void set_stop_on_violation(bool v) { stop_on_violation_ = v; }

  //! 0 means unbounded.
  std::size_t max_depth() const { return max_depth_; }

  void set_max_depth(std::size_t v) { max_depth_ = v; }

  //! 0 means unbounded.
  std::size_t max_states() const { return max_states_; }

  void set_max_states(std::size_t v) { max_states_ = v; }

  std::size_t num_visited_states() const { return num_visited_states_; }

  std::size_t num_queued_states() const { return num_queued_states_; }

  std::size_t max_reached_depth() const { return max_reached_depth_; }

  //! True if the search stopped early because of max_states.
  bool exhausted() const { return exhausted_; }

  const Discoveries& discoveries() const { return discoveries_; }

  void set_monitor(
      std::function<bool(const EvalBase&, StateQueue<State>*)> monitor) {
    monitor_ = std::move(monitor);
  }

  void unset_monitor() {
    monitor_ = std::function<bool(const EvalBase&, StateQueue<State>*)>();
  }

  /**
   * The monitor may be used to obtain intermediate results. Note that, it can
   * also be used to modify the list of accept states. This implies that the
   * evaluation must not use the list of accept states itself.
   *
   * @return True if evaluation should continue; false otherwise.
   */
  bool monitor(StateQueue<State>* accept_states) {
    if (monitor_) {
      return monitor_(*this, accept_states);
    }

    return true;
  }

  /**
   * Reconstructs the concrete states along a path of state hashes by
   * replaying the rules of ts. Properties are not consulted.
   *
   * @param start_states Must contain the first state of hash_trace.
   * @param hash_trace Hashes ordered from last to first state.
   * @return Trace from the start state; the rule of the last step is empty.
   *
   * @pre hash_trace is not empty.
   */
  Trace MakeTraceFromHashTrace(const StateQueue<State>& start_states,
                               const HashTrace& hash_trace,
                               const TransitionSystem& ts) const {
    Expects(!hash_trace.empty());
    auto hash_it = hash_trace.rbegin();

    auto start = std::find_if(
        start_states.begin(), start_states.end(),
        [&hash_it](const State& state) { return GetHash(state) == *hash_it; });
    Expects(start != start_states.end());

    Trace result;
    State current = *start;
    for (++hash_it; hash_it != hash_trace.rend(); ++hash_it) {
      bool found = false;
      for (const auto& rule : ts.rules()) {
        if (!rule->Enabled(current)) continue;

        State next(current);
        try {
          if (!rule->Apply(&next)) continue;
        } catch (const BoundExceeded&) {
          continue;
        }

        if (GetHash(next) == *hash_it) {
          result.emplace_back(std::move(current), rule->name());
          current = std::move(next);
          found = true;
          break;
        }
      }
      Expects(found);
    }

    result.emplace_back(std::move(current), "");
    return result;
  }

 protected:
  /**
   * Handles a violation found on the current branch.
   *
   * @throw ErrorTrace if stop_on_violation is set.
   */
  void RecordViolation(const Error& error, Trace trace) {
    if (stop_on_violation_) {
      throw ErrorTrace(error, std::move(trace));
    }

    auto it = discoveries_.find(error.what());
    if (it == discoveries_.end()) {
      discoveries_.emplace(error.what(), ErrorTrace(error, std::move(trace)));
    } else if (trace.size() < it->second.trace().size()) {
      it->second = ErrorTrace(error, std::move(trace));
    }
  }

  bool AtDepthBound(std::size_t depth) const {
    return max_depth_ != 0 && depth >= max_depth_;
  }

  /**
   * @return true if the state limit has been reached; marks the search as
   *    exhausted.
   */
  bool StateLimitReached() {
    if (max_states_ != 0 && num_visited_states_ >= max_states_) {
      exhausted_ = true;
      return true;
    }

    return false;
  }

  void UpdateMaxDepth(std::size_t depth) {
    max_reached_depth_ = std::max(max_reached_depth_, depth);
  }

  bool verbose_on_error_;
  bool stop_on_violation_ = true;
  std::size_t max_depth_ = 0;
  std::size_t max_states_ = 0;

  std::size_t num_visited_states_ = 0;
  std::size_t num_queued_states_ = 0;
  std::size_t max_reached_depth_ = 0;
  bool exhausted_ = false;
  Discoveries discoveries_;

  std::function<bool(const EvalBase&, StateQueue<State>*)> monitor_;
};

}  // namespace core
}  // namespace mcorch

#endif /* MCORCH_CORE_EVAL_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
