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

#include "mcorch/actor/kubelet.hh"

#include <ostream>

#include "mcorch/core/ts.hh"

namespace mcorch {
namespace actor {

std::size_t KubeletState::Hash::operator()(const KubeletState& k) const {
  std::size_t h = 0;
  for (const auto& kv : k.running) {
    CombineHash(kv.first, &h);
    CombineHash(kv.second, &h);
  }
  return h;
}

std::ostream& operator<<(std::ostream& os, const KubeletState& state) {
  for (const auto& kv : state.running) {
    os << " |   pod" << kv.first << " running on node" << kv.second
       << std::endl;
  }
  return os;
}

bool Kubelet::Handle(const system::ClusterConfig& config, const Envelope& env,
                     std::size_t choice, State* state, Outbox* out) {
  if (choice != 0) return false;

  switch (env.msg.type) {
    case Msg::Type::StartPod:
      state->running[env.msg.pod] = env.msg.node;
      out->Send(kDatastoreId, Msg::MakePodRunning(env.msg.pod));
      return true;

    case Msg::Type::StopPod:
      state->running.erase(env.msg.pod);
      out->Send(kDatastoreId, Msg::MakePodStopped(env.msg.pod));
      return true;

    default:
      throw core::Error("kubelet: unexpected message " + ToString(env.msg));
  }
}

}  // namespace actor
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
