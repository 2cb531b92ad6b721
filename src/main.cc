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

#include <iostream>
#include <string>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "mcorch/io.hh"
#include "mcorch/os.hh"
#include "models/main.hh"

using namespace mcorch;

namespace {

void PrintBanner() {
  const std::string rule(50, '=');
  std::cout << kColCYN << rule << std::endl
            << "mcorch: cluster control plane model checker" << std::endl
            << "built on " __DATE__ ", " __TIME__ << std::endl
            << rule << kColRst << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage(
      "runmodel <model> [<args>...]\n"
      "  runmodel list    lists the available models");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  PrintBanner();
  if (!os::LimitAddressSpace(FLAGS_os_memlimit)) {
    WarnOut() << "Memory limit not applied as requested; running out of "
                 "memory may kill the process"
              << std::endl;
  }
  std::cout << std::endl;

  if (argc < 2) {
    ErrOut() << "Missing command; see --help" << std::endl;
    return 1;
  }

  const std::string command = argv[1];
  if (command != "runmodel") {
    ErrOut() << "Invalid command: " << command << std::endl;
    return 1;
  }

  return models::Main(argc, argv);
}

/* vim: set ts=2 sts=2 sw=2 et : */
