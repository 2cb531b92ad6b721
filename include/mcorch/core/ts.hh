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

#ifndef MCORCH_CORE_TS_HH_
#define MCORCH_CORE_TS_HH_

#include <algorithm>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <gsl/gsl>

namespace mcorch {
namespace core {

template <class State>
using StateHash =
    typename std::result_of<typename State::Hash(const State&)>::type;

/**
 * Successor set of one state, keyed by state hash. Distinct states with equal
 * hashes are kept side by side; the values stay movable, unlike the keys of a
 * set.
 */
template <class State>
using StateMap = std::unordered_multimap<StateHash<State>, State>;

template <class State>
using StateQueue = std::list<State>;

//! Name of the first rule producing each successor, by hash.
template <class State>
using RuleNames = std::unordered_map<StateHash<State>, std::string>;

template <class State>
inline StateHash<State> GetHash(const State& state) {
  return typename State::Hash()(state);
}

//! Base of all violations found while exploring.
struct Error : std::logic_error {
  using std::logic_error::logic_error;
};

//! A non-accepting state without successors.
struct Deadlock : Error {
  using Error::Error;
};

//! An invariant does not hold; what() is the invariant's name.
struct PropertyViolation : Error {
  using Error::Error;
};

//! A progress goal is never reached; what() is the property's name.
struct LivenessViolation : Error {
  using Error::Error;
};

/**
 * Thrown by a rule action if the successor would exceed a bound of the model
 * (e.g. a full network). The successor is discarded and counted as truncated;
 * this is never a violation.
 */
struct BoundExceeded : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/**
 * One kind of step of the model. The rule name appears in counterexample
 * traces, so it should identify the step uniquely (e.g. "Deliver[3]").
 */
template <class State>
class Rule {
 public:
  typedef std::unique_ptr<Rule> Ptr;

  explicit Rule(std::string name) : name_(std::move(name)) {
    Expects(!name_.empty());
  }

  virtual ~Rule() = default;

  virtual bool Enabled(const State& state) const = 0;

  /**
   * Applies the step to a copy of the current state.
   *
   * @return false if the rule turned out not to apply; state is discarded.
   * @throw BoundExceeded if the successor exceeds a model bound.
   */
  virtual bool Apply(State* state) const = 0;

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

template <class State>
class RuleF : public Rule<State> {
 public:
  RuleF(std::string name, std::function<bool(const State&)> enabled,
        std::function<bool(State*)> apply)
      : Rule<State>(std::move(name)),
        enabled_(std::move(enabled)),
        apply_(std::move(apply)) {}

  bool Enabled(const State& state) const override { return enabled_(state); }

  bool Apply(State* state) const override { return apply_(state); }

 private:
  std::function<bool(const State&)> enabled_;
  std::function<bool(State*)> apply_;
};

/**
 * A checked property. Safety properties override Invariant; temporal ones
 * observe the explored graph through Next and report at the end through
 * IsSatisfied.
 */
template <class State>
class Property {
 public:
  typedef std::unique_ptr<Property> Ptr;

  explicit Property(std::string name) : name_(std::move(name)) {
    Expects(!name_.empty());
  }

  virtual ~Property() = default;

  //! Forgets everything recorded by Next.
  virtual void Reset() {}

  virtual bool Invariant(const State& state) const { return true; }

  /**
   * Called once the successors of state are known. Not called for a state
   * whose successors were all discarded by a model bound.
   *
   * @param rule_names Rule producing each of next_states.
   * @throw Error (e.g. LivenessViolation) to report a violation on the
   *    current path.
   */
  virtual void Next(const State& state, const StateMap<State>& next_states,
                    const RuleNames<State>& rule_names) {}

  /**
   * @param verbose_on_error Print the offending cycle.
   * @return false if the states seen through Next violate the property.
   */
  virtual bool IsSatisfied(bool verbose_on_error = true) const { return true; }

  /**
   * Evidence for a failed IsSatisfied: the states of the offending cycle,
   * each with the rule taken from it. Empty if there is none.
   */
  virtual std::vector<std::pair<StateHash<State>, std::string>> Cycle() const {
    return {};
  }

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

template <class State>
class InvariantF : public Property<State> {
 public:
  InvariantF(std::string name, std::function<bool(const State&)> holds)
      : Property<State>(std::move(name)), holds_(std::move(holds)) {}

  bool Invariant(const State& state) const override { return holds_(state); }

 private:
  std::function<bool(const State&)> holds_;
};

/**
 * Rules and properties of a model. Evaluating a state does not change the
 * transition system, except for what temporal properties record and the
 * truncation counter.
 */
template <class StateT>
class TransitionSystem {
 public:
  typedef StateT State;
  typedef typename Rule<State>::Ptr RulePtr;
  typedef typename Property<State>::Ptr PropertyPtr;

  /**
   * @param deadlock_detection Report states without successors as Deadlock;
   *    off for models where such states complete a path.
   */
  explicit TransitionSystem(bool deadlock_detection = true)
      : deadlock_detection_(deadlock_detection) {}

  TransitionSystem(const TransitionSystem& rhs) = delete;

  TransitionSystem(TransitionSystem&& rhs) = default;

  void Reset() {
    for (auto& property : properties_) {
      property->Reset();
    }
    num_truncated_ = 0;
  }

  //! @throw PropertyViolation naming the first invariant that does not hold.
  void CheckInvariants(const State& state) const {
    for (const auto& property : properties_) {
      if (!property->Invariant(state)) {
        throw PropertyViolation(property->name());
      }
    }
  }

  /**
   * Checks the invariants of state and computes its successors. A state whose
   * successors were all truncated returns no successors and is neither a
   * deadlock nor passed to temporal properties.
   *
   * @param rule_names If set, receives the name of the first rule producing
   *    each successor, by hash.
   * @throw Error on a violation.
   */
  StateMap<State> Evaluate(const State& state,
                           RuleNames<State>* rule_names = nullptr) {
    CheckInvariants(state);

    RuleNames<State> local_names;
    if (rule_names == nullptr) rule_names = &local_names;

    StateMap<State> next_states;
    std::size_t truncated = 0;

    for (const auto& rule : rules_) {
      if (!rule->Enabled(state)) continue;

      State next(state);
      try {
        if (!rule->Apply(&next)) continue;
      } catch (const BoundExceeded&) {
        ++truncated;
        continue;
      }

      const auto range = next_states.equal_range(GetHash(next));
      if (std::none_of(range.first, range.second,
                       [&next](const typename StateMap<State>::value_type& v) {
                         return v.second == next;
                       })) {
        const auto hash = GetHash(next);
        rule_names->emplace(hash, rule->name());
        next_states.emplace(hash, std::move(next));
      }
    }

    num_truncated_ += truncated;
    if (next_states.empty()) {
      if (truncated != 0) return next_states;
      if (deadlock_detection_) throw Deadlock("DEADLOCK");
    }

    for (auto& property : properties_) {
      property->Next(state, next_states, *rule_names);
    }

    return next_states;
  }

  //! Constructs and adds a rule or property; returns a non-owning pointer.
  template <class T, class... Args>
  const T* Make(Args&&... args) {
    auto own = std::make_unique<T>(std::forward<Args>(args)...);
    const T* result = own.get();
    Add(std::move(own));
    return result;
  }

  //! Number of successors discarded by model bounds since the last Reset.
  std::size_t num_truncated() const { return num_truncated_; }

  const std::vector<RulePtr>& rules() const { return rules_; }

  const std::vector<PropertyPtr>& properties() const { return properties_; }

 private:
  void Add(RulePtr rule) { rules_.push_back(std::move(rule)); }

  void Add(PropertyPtr property) { properties_.push_back(std::move(property)); }

  bool deadlock_detection_;
  std::size_t num_truncated_ = 0;
  std::vector<RulePtr> rules_;
  std::vector<PropertyPtr> properties_;
};

}  // namespace core
}  // namespace mcorch

#endif /* MCORCH_CORE_TS_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
