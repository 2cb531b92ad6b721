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

#include "mcorch/actor/replicaset.hh"

#include <ostream>
#include <vector>

#include <glog/logging.h>

#include "mcorch/actor/resources.hh"
#include "mcorch/core/ts.hh"

namespace mcorch {
namespace actor {

std::uint32_t ReplicasetView::CurrentScale() const {
  std::uint32_t result = 0;
  for (const auto& kv : pods) {
    if (IsActive(kv.second.phase)) ++result;
  }
  return result;
}

std::size_t ReplicasetControllerState::Hash::operator()(
    const ReplicasetControllerState& k) const {
  std::size_t h = 0;
  for (const auto& rs : k.replicasets) {
    CombineHash(rs.first, &h);
    CombineHash(rs.second.known, &h);
    CombineHash(rs.second.desired, &h);
    CombineHash(rs.second.revision, &h);
    for (const auto& pod : rs.second.pods) {
      CombineHash(pod.first, &h);
      CombineHash(pod.second.phase, &h);
      CombineHash(pod.second.revision, &h);
    }
  }
  return h;
}

std::ostream& operator<<(std::ostream& os,
                         const ReplicasetControllerState& state) {
  for (const auto& rs : state.replicasets) {
    os << " |   rs" << rs.first << " = ";
    if (rs.second.known) {
      os << rs.second.CurrentScale() << "/" << rs.second.desired;
    } else {
      os << "?";
    }
    os << " @" << rs.second.revision << std::endl;

    for (const auto& pod : rs.second.pods) {
      os << " |     pod" << pod.first << " = " << pod.second.phase << " @"
         << pod.second.revision << std::endl;
    }
  }
  return os;
}

void ReplicasetController::Reconcile(const system::ClusterConfig& config,
                                     ReplicasetId id, ReplicasetView* view,
                                     Outbox* out) {
  const auto current = view->CurrentScale();

  if (view->desired > current) {
    auto missing = view->desired - current;
    for (std::uint32_t ordinal = 0; missing != 0 && ordinal <= 0xffff;
         ++ordinal) {
      // Ordinals are never reused, tombstones included.
      const auto pod = MakePodId(id, ordinal);
      if (view->pods.count(pod) != 0) continue;

      view->pods.emplace(pod, ReplicasetView::PodView{PodPhase::Pending, 0});
      out->Send(kDatastoreId,
                Msg::MakeCreatePod(pod, id, config.pod_cpu, config.pod_mem));
      --missing;
    }
  } else if (current > view->desired) {
    auto excess = current - view->desired;
    for (auto it = view->pods.rbegin(); excess != 0 && it != view->pods.rend();
         ++it) {
      if (!IsActive(it->second.phase)) continue;

      it->second.phase = PodPhase::Terminating;
      out->Send(kDatastoreId, Msg::MakeDeletePod(it->first));
      --excess;
    }
  }
}

bool ReplicasetController::Handle(const system::ClusterConfig& config,
                                  const Envelope& env, std::size_t choice,
                                  State* state, Outbox* out) {
  if (choice != 0) return false;

  const Msg& msg = env.msg;
  ReplicasetView* view = &state->replicasets[msg.replicaset];
  bool changed = false;

  switch (msg.type) {
    case Msg::Type::ReplicasetChanged:
      if (!view->known || msg.revision > view->revision) {
        changed = !view->known || view->desired != msg.replicas;
        view->known = true;
        view->desired = msg.replicas;
        view->revision = msg.revision;
      }
      break;

    case Msg::Type::PodChanged: {
      auto it = view->pods.find(msg.pod);
      if (it == view->pods.end()) {
        view->pods.emplace(msg.pod,
                           ReplicasetView::PodView{msg.phase, msg.revision});
        changed = true;
      } else if (msg.revision > it->second.revision) {
        changed = it->second.phase != msg.phase;
        it->second = ReplicasetView::PodView{msg.phase, msg.revision};
      }
    } break;

    default:
      throw core::Error("replicaset controller: unexpected message " +
                        ToString(msg));
  }

  if (changed && view->known) {
    VLOG(3) << "controller " << out->self() << ": reconcile rs"
            << msg.replicaset << " " << view->CurrentScale() << "/"
            << view->desired;
    Reconcile(config, msg.replicaset, view, out);
  }

  return true;
}

}  // namespace actor
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
