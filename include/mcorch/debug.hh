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

#ifndef MCORCH_DEBUG_HH_
#define MCORCH_DEBUG_HH_

#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "mcorch/io.hh"

namespace mcorch {

namespace detail {

inline std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream iss(text);
  for (std::string line; std::getline(iss, line);) {
    lines.push_back(std::move(line));
  }
  return lines;
}

}  // namespace detail

/**
 * Prints the elements of a trace one after the other, marking the lines that
 * differ from the previous element: in cyan if highlight is set, otherwise
 * with a leading "* ".
 *
 * @param trace Sequence of elements.
 * @param print Writes one element; its output is diffed line by line.
 * @param separator Written after each element, not diffed.
 * @param[out] os The output stream.
 */
template <class Trace, class PrintFunc, class SeparatorFunc>
void PrintTraceDiff(const Trace& trace, PrintFunc print,
                    SeparatorFunc separator, std::ostream& os,
                    bool highlight = true) {
  std::vector<std::string> previous;

  for (const auto& element : trace) {
    std::ostringstream oss;
    print(element, oss);
    auto lines = detail::SplitLines(oss.str());

    const bool same_shape = lines.size() == previous.size();
    for (std::size_t i = 0; i < lines.size(); ++i) {
      const bool changed = !same_shape || lines[i] != previous[i];
      if (!changed) {
        os << (highlight ? "" : "  ") << lines[i] << std::endl;
      } else if (highlight) {
        os << kColCYN << lines[i] << kColRst << std::endl;
      } else {
        os << "* " << lines[i] << std::endl;
      }
    }

    previous = std::move(lines);
    separator(element, os);
  }
}

}  // namespace mcorch

#endif /* MCORCH_DEBUG_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
