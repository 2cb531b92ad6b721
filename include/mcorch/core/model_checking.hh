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

#ifndef MCORCH_CORE_MODEL_CHECKING_HH_
#define MCORCH_CORE_MODEL_CHECKING_HH_

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <gsl/gsl>

#include "eval.hh"
#include "ts.hh"

namespace mcorch {
namespace core {

namespace detail {

/**
 * Evaluates state, returning its successors ordered by hash together with the
 * name of a rule producing each; the order is deterministic for a given
 * transition system.
 */
template <class TransitionSystem>
std::vector<std::pair<std::string, typename TransitionSystem::State>>
OrderedSuccessors(const typename TransitionSystem::State& state,
                  TransitionSystem* ts) {
  using State = typename TransitionSystem::State;

  RuleNames<State> rule_names;
  auto next_states = ts->Evaluate(state, &rule_names);

  std::vector<std::pair<StateHash<State>, State>> ordered;
  ordered.reserve(next_states.size());
  for (auto& kv : next_states) {
    ordered.emplace_back(kv.first, std::move(kv.second));
  }

  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const std::pair<StateHash<State>, State>& a,
                      const std::pair<StateHash<State>, State>& b) {
                     return a.first < b.first;
                   });

  std::vector<std::pair<std::string, State>> result;
  result.reserve(ordered.size());
  for (auto& kv : ordered) {
    result.emplace_back(rule_names[kv.first], std::move(kv.second));
  }

  return result;
}

}  // namespace detail

/**
 * Breadth-First-Search based search with state hashing.
 *
 * Space efficient search based on state hashing, where the states themselves
 * are discarded after evaluation. However, due to hash collisions there is a
 * possibility of some distinct states are considered the same [1]. Finds the
 * shortest counterexample per property.
 *
 * [1] <a href="http://spinroot.com/spin/Doc/pstv87.pdf">
 *      Holzmann, Gerard J. "On Limits and Possibilities of Automated Protocol
 *      Analysis." PSTV. Vol. 87. 1987</a>
 */
template <class TransitionSystemT>
class Eval_BFS : public EvalBase<TransitionSystemT> {
 public:
  using typename EvalBase<TransitionSystemT>::TransitionSystem;
  using typename EvalBase<TransitionSystemT>::State;
  using typename EvalBase<TransitionSystemT>::HashTrace;

  const char* name() const override { return "Eval_BFS"; }

  StateQueue<State> Evaluate(const StateQueue<State>& start_states,
                             TransitionSystem* ts) override {
    Expects(!start_states.empty());
    Expects(this->num_visited_states() == 0);
    Expects(this->num_queued_states() == 0);

    StateQueue<State> result;
    std::unordered_map<StateHash<State>, Parent> parents;
    StateQueue<State> current_states;

    // Denote start states
    for (const auto& start_state : start_states) {
      const auto hash = GetHash(start_state);
      if (parents.emplace(hash, Parent{hash, 0}).second) {
        current_states.push_back(start_state);
      }
    }

    this->num_queued_states_ = current_states.size();

    while (!current_states.empty() && this->monitor(&result) &&
           !this->StateLimitReached()) {
      const auto& current_state = current_states.front();
      const auto current_hash = GetHash(current_state);
      const auto depth = parents[current_hash].depth;
      this->UpdateMaxDepth(depth);

      if (current_state.Accept()) {
        result.push_back(current_state);
      }

      StateMap<State> next_states;

      try {
        if (this->AtDepthBound(depth)) {
          ts->CheckInvariants(current_state);
        } else {
          next_states = ts->Evaluate(current_state);
        }
        ++this->num_visited_states_;
      } catch (const Error& error) {
        this->RecordViolation(
            error, this->MakeTraceFromHashTrace(
                       start_states, BackTrace(parents, current_hash), *ts));
      }

      for (auto& next_state : next_states) {
        if (parents.find(next_state.first) == parents.end()) {
          parents.emplace(next_state.first,
                          Parent{current_hash, depth + 1});

          // invalidates next_state
          current_states.emplace_back(std::move(next_state.second));
          ++this->num_queued_states_;
        }
      }

      current_states.pop_front();
      --this->num_queued_states_;
    }

    return result;
  }

 private:
  struct Parent {
    StateHash<State> hash;
    std::size_t depth;
  };

  static HashTrace BackTrace(
      const std::unordered_map<StateHash<State>, Parent>& parents,
      StateHash<State> current_hash) {
    HashTrace back_trace;

    for (;;) {
      back_trace.push_back(current_hash);

      const auto parent_hash = parents.at(current_hash).hash;
      if (parent_hash == current_hash) {
        // Found start state.
        return back_trace;
      }

      current_hash = parent_hash;
    }
  }
};

/**
 * Depth-First-Search based search with state hashing.
 *
 * Each visited state hash is stored with the smallest depth it has been
 * reached at; a state reached again at a smaller depth is explored again, so
 * that a depth bound does not hide states reachable via a shorter path.
 * Counterexamples are taken directly from the search stack.
 */
template <class TransitionSystemT>
class Eval_DFS : public EvalBase<TransitionSystemT> {
 public:
  using typename EvalBase<TransitionSystemT>::TransitionSystem;
  using typename EvalBase<TransitionSystemT>::State;
  using typename EvalBase<TransitionSystemT>::Trace;

  const char* name() const override { return "Eval_DFS"; }

  StateQueue<State> Evaluate(const StateQueue<State>& start_states,
                             TransitionSystem* ts) override {
    Expects(!start_states.empty());
    Expects(this->num_visited_states() == 0);
    Expects(this->num_queued_states() == 0);

    StateQueue<State> result;
    std::unordered_map<StateHash<State>, std::size_t> visited;
    std::vector<Frame> stack;

    for (const auto& start_state : start_states) {
      Visit(start_state, "", &visited, &stack, &result, ts);

      while (!stack.empty()) {
        if (!this->monitor(&result) || this->StateLimitReached()) {
          return result;
        }

        auto& top = stack.back();
        if (top.next == top.children.size()) {
          stack.pop_back();
          continue;
        }

        auto child = std::move(top.children[top.next++]);
        --this->num_queued_states_;

        // invalidates top
        Visit(child.second, std::move(child.first), &visited, &stack, &result,
              ts);
      }
    }

    return result;
  }

 private:
  struct Frame {
    State state;
    std::string via;
    std::vector<std::pair<std::string, State>> children;
    std::size_t next;
  };

  void Visit(const State& state, std::string via,
             std::unordered_map<StateHash<State>, std::size_t>* visited,
             std::vector<Frame>* stack, StateQueue<State>* result,
             TransitionSystem* ts) {
    const auto depth = stack->size();
    const auto hash = GetHash(state);

    auto seen = visited->find(hash);
    const bool first_visit = seen == visited->end();
    if (first_visit) {
      visited->emplace(hash, depth);
    } else {
      if (seen->second <= depth) return;
      seen->second = depth;
    }

    this->UpdateMaxDepth(depth);

    // A shallower revisit is expanded again, but its state was already
    // returned.
    if (first_visit && state.Accept()) {
      result->push_back(state);
    }

    std::vector<std::pair<std::string, State>> children;

    try {
      if (this->AtDepthBound(depth)) {
        ts->CheckInvariants(state);
      } else {
        children = detail::OrderedSuccessors(state, ts);
      }
      ++this->num_visited_states_;
    } catch (const Error& error) {
      this->RecordViolation(error, MakeTrace(*stack, state, via));
      return;
    }

    this->num_queued_states_ += children.size();
    stack->push_back(Frame{state, std::move(via), std::move(children), 0});
  }

  static Trace MakeTrace(const std::vector<Frame>& stack, const State& last,
                         const std::string& via) {
    Trace trace;
    trace.reserve(stack.size() + 1);

    for (std::size_t i = 0; i < stack.size(); ++i) {
      trace.emplace_back(stack[i].state,
                         i + 1 < stack.size() ? stack[i + 1].via : via);
    }

    trace.emplace_back(last, "");
    return trace;
  }
};

}  // namespace core
}  // namespace mcorch

#endif /* MCORCH_CORE_MODEL_CHECKING_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
