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

#ifndef MCORCH_CORE_TYPES_HH_
#define MCORCH_CORE_TYPES_HH_

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include <mc2lib/sets.hpp>

namespace mcorch {
namespace core {

template <class T, class = void>
struct Hasher {
  typedef typename T::Hash type;
};

template <class T>
struct Hasher<T, typename std::enable_if<std::is_fundamental<T>::value>::type> {
  typedef std::hash<T> type;
};

template <class T>
struct Hasher<T, typename std::enable_if<std::is_enum<T>::value>::type> {
  struct type {
    auto operator()(const T& k) const {
      return std::hash<std::size_t>()(static_cast<std::size_t>(k));
    }
  };
};

template <>
struct Hasher<std::string> {
  typedef std::hash<std::string> type;
};

/**
 * Copy-on-write reference to an immutable value.
 *
 * Copying a Ref only copies a pointer; the referenced value is shared until
 * one of the copies is modified via Mut(), at which point the modifying copy
 * gets its own private value. Global states are composed of Refs, so that
 * deriving a successor state only duplicates the components that changed.
 *
 * The hash of the value is cached in the shared node, and invalidated by
 * Mut().
 */
template <class T>
class Ref {
 public:
  typedef T Element;

  struct Hash {
    std::size_t operator()(const Ref& k) const {
      if (!k.node_->hash_valid) {
        k.node_->hash = typename Hasher<T>::type()(k.node_->value);
        k.node_->hash_valid = true;
      }

      return k.node_->hash;
    }
  };

  Ref() : node_(std::make_shared<Node>(T())) {}

  explicit Ref(T value) : node_(std::make_shared<Node>(std::move(value))) {}

  const T& operator*() const { return node_->value; }

  const T* operator->() const { return &node_->value; }

  const T& get() const { return node_->value; }

  /**
   * @return Pointer to a value owned exclusively by this Ref; only valid until
   *    this Ref is copied.
   */
  T* Mut() {
    if (node_.use_count() > 1) {
      node_ = std::make_shared<Node>(node_->value);
    } else {
      node_->hash_valid = false;
    }

    return &node_->value;
  }

  bool shared() const { return node_.use_count() > 1; }

  bool operator==(const Ref& rhs) const {
    return node_ == rhs.node_ || node_->value == rhs.node_->value;
  }

  bool operator!=(const Ref& rhs) const { return !(*this == rhs); }

 private:
  struct Node {
    explicit Node(T v) : value(std::move(v)) {}

    T value;
    mutable std::size_t hash = 0;
    mutable bool hash_valid = false;
  };

  std::shared_ptr<Node> node_;
};

template <class T>
using Relation =
    mc2lib::sets::Relation<mc2lib::sets::Types<T, typename Hasher<T>::type>>;

}  // namespace core
}  // namespace mcorch

#endif /* MCORCH_CORE_TYPES_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
