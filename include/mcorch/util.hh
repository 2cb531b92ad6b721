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

#ifndef MCORCH_UTIL_HH_
#define MCORCH_UTIL_HH_

#include <cstddef>
#include <functional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "mcorch/core/types.hh"

namespace mcorch {

/**
 * Mixes the hash of in into seed (the mixing step of boost's hash_combine).
 */
template <class InT, class OutT, class Hash = typename core::Hasher<InT>::type>
inline void CombineHash(const InT& in, OutT* seed) {
  *seed ^= Hash()(in) + 0x9e3779b9 + (*seed << 6) + (*seed >> 2);
}

//! Mixes the hashes of [first, last) into seed, in order.
template <class It, class OutT>
inline void CombineHashRange(It first, It last, OutT* seed) {
  for (; first != last; ++first) {
    CombineHash(*first, seed);
  }
}

namespace detail {

//! Splits a stringified enumerator list "A, B, C" into its names.
inline std::vector<std::string> EnumNames(const char* list) {
  std::vector<std::string> names;
  std::istringstream iss(list);
  for (std::string name; std::getline(iss, name, ',');) {
    const auto first = name.find_first_not_of(' ');
    names.push_back(first == std::string::npos ? "" : name.substr(first));
  }
  return names;
}

}  // namespace detail
}  // namespace mcorch

/**
 * Defines enum class T with an operator<< printing the enumerator's name.
 * Enumerators must not have explicit values. func_attr is inline, or friend
 * for an enum nested in a class.
 */
#define PRINTABLE_ENUM_CLASS(T, func_attr, ...)                     \
  enum class T { __VA_ARGS__ };                                     \
  func_attr std::ostream& operator<<(std::ostream& os, const T& v) { \
    static const std::vector<std::string> names =                   \
        ::mcorch::detail::EnumNames(#__VA_ARGS__);                  \
    return os << names.at(static_cast<std::size_t>(v));             \
  }

#endif /* MCORCH_UTIL_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
