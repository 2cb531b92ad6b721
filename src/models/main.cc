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

#include "main.hh"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <glog/logging.h>

#include "mcorch/command.hh"
#include "mcorch/config.hh"
#include "mcorch/history/checker.hh"
#include "mcorch/io.hh"
#include "mcorch/system/model.hh"
#include "mcorch/system/state.hh"

namespace models {

using namespace mcorch;

Registry::Map Registry::models_;

bool Registry::Add(const std::string& name, EntryPoint entry_point) {
  if (entry_point == nullptr) {
    throw std::invalid_argument("null entry point for model " + name);
  }

  if (!models_.emplace(name, entry_point).second) {
    throw std::invalid_argument("model registered twice: " + name);
  }

  return true;
}

#define REGISTER_MODEL(name)               \
  do {                                     \
    extern int Main_##name(int, char* []); \
    Registry::Add(#name, Main_##name);     \
  } while (0)

int RunCluster(const std::string& name, system::ClusterConfig cluster) {
  RunConfig config;
  core::StateQueue<system::SystemState> start_states;

  try {
    config = RunConfig::FromFlags();
    config.ApplyTo(&cluster);
    start_states.emplace_back(
        std::make_shared<const system::ClusterConfig>(cluster));
  } catch (const system::ConfigError& e) {
    ErrOut() << "Invalid configuration: " << e.what() << std::endl;
    return 2;
  }

  InfoOut() << "Model " << name << ": " << cluster << std::endl;
  InfoOut() << "Run: " << config << std::endl;

  system::ModelOptions options;
  options.incremental_consistency = config.incremental_consistency;
  options.contract = config.consistency;
  options.liveness = config.liveness;

  auto transition_system = system::MakeTransitionSystem(cluster, options);

  ModelCheckerCommand<system::TransitionSystem> command(config, name);

  const history::Checker checker(config.consistency);
  command.set_path_check([checker](const system::SystemState& state) {
    return Report::PathVerdict{state.history().operations().size(),
                               checker(state.history())};
  });

  return command(start_states, &transition_system);
}

int Main(int argc, char* argv[]) {
#include "models/registry.hh"

  if (argc < 3) {
    LOG(ERROR) << "Please specify model (or 'list' to list)!";
    return 1;
  }

  std::string model_name = argv[2];
  if (model_name == "list") {
    std::cout << std::endl << "Available models:" << std::endl;
    for (const auto& model : Registry::models()) {
      std::cout << "    " << model.first << std::endl;
    }
    std::cout << std::endl;
  } else {
    auto model = Registry::models().find(model_name);
    if (model == Registry::models().end()) {
      LOG(ERROR) << "No such model (use 'list' to see all available): "
                 << model_name;
      return 1;
    }

    return model->second(argc - 2, &argv[2]);
  }

  return 0;
}

}  // namespace models

/* vim: set ts=2 sts=2 sw=2 et : */
