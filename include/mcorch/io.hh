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

#ifndef MCORCH_IO_HH_
#define MCORCH_IO_HH_

#include <iostream>

namespace mcorch {

constexpr auto kColRst = "\e[0m";
constexpr auto kColRED = "\e[1;31m";
constexpr auto kColGRN = "\e[1;32m";
constexpr auto kColBLU = "\e[1;34m";
constexpr auto kColCYN = "\e[1;36m";

enum class Level { kInfo, kWarning, kError };

/**
 * Starts a console line with a colored level tag and a timestamp: the wall
 * clock time on the first line of the process, seconds elapsed since then on
 * all following ones.
 */
std::ostream& ConsoleLine(Level level);

inline std::ostream& InfoOut() { return ConsoleLine(Level::kInfo); }

inline std::ostream& WarnOut() { return ConsoleLine(Level::kWarning); }

inline std::ostream& ErrOut() { return ConsoleLine(Level::kError); }

}  // namespace mcorch

#endif /* MCORCH_IO_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
