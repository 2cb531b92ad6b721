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

#include "mcorch/io.hh"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <string>

namespace mcorch {

namespace {

std::once_flag start_once;
std::chrono::steady_clock::time_point start_time;

void Timestamp(std::ostream& os) {
  bool first = false;
  std::call_once(start_once, [&first] {
    start_time = std::chrono::steady_clock::now();
    first = true;
  });

  if (first) {
    const auto now =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::string now_str(std::ctime(&now));
    os << now_str.substr(0, now_str.length() - 1);
    return;
  }

  const std::chrono::duration<double> elapsed =
      std::chrono::steady_clock::now() - start_time;
  os << std::fixed << std::setprecision(3) << elapsed.count() << "s";
}

}  // namespace

std::ostream& ConsoleLine(Level level) {
  const char* tag;
  const char* color;
  std::ostream* os = &std::cerr;

  switch (level) {
    case Level::kInfo:
      tag = "INFO";
      color = "\e[0;35m";
      os = &std::cout;
      break;
    case Level::kWarning:
      tag = "WARNING";
      color = "\e[0;33m";
      break;
    default:
      tag = "ERROR";
      color = "\e[0;31m";
      break;
  }

  *os << color << tag << "[\e[0;32m";
  Timestamp(*os);
  return *os << color << "]: " << kColRst;
}

}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
