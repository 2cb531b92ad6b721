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

#include "mcorch/actor/scheduler.hh"

#include <algorithm>
#include <ostream>

#include <glog/logging.h>

#include "mcorch/core/ts.hh"

namespace mcorch {
namespace actor {

std::size_t SchedulerState::Hash::operator()(const SchedulerState& k) const {
  std::size_t h = 0;
  CombineHashRange(k.nodes.begin(), k.nodes.end(), &h);
  for (const auto& kv : k.bindings) {
    CombineHash(kv.first, &h);
    CombineHash(kv.second.node, &h);
    CombineHash(kv.second.request, &h);
  }
  for (const auto& kv : k.waiting) {
    CombineHash(kv.first, &h);
    CombineHash(kv.second, &h);
  }
  return h;
}

const Node* SchedulerState::FindNode(NodeId id) const {
  auto it = std::lower_bound(
      nodes.begin(), nodes.end(), id,
      [](const Node& node, NodeId id) { return node.id < id; });
  return it != nodes.end() && it->id == id ? &*it : nullptr;
}

std::ostream& operator<<(std::ostream& os, const SchedulerState& state) {
  for (const auto& node : state.nodes) {
    os << " |   node" << node.id << " = " << node.allocated << std::endl;
  }

  for (const auto& kv : state.bindings) {
    os << " |   pod" << kv.first << " -> node" << kv.second.node << std::endl;
  }

  for (const auto& kv : state.waiting) {
    os << " |   pod" << kv.first << " waiting" << std::endl;
  }

  return os;
}

namespace {

//! Binds pod to the first node it fits on; false if there is none.
bool Place(PodId pod, const Resources& request, SchedulerState* state,
           Outbox* out) {
  for (auto& node : state->nodes) {
    if (node.Fits(request)) {
      node.allocated += request;
      state->bindings.emplace(pod, SchedulerState::Binding{node.id, request});
      out->Send(kDatastoreId, Msg::MakeBindPod(pod, node.id));
      return true;
    }
  }
  return false;
}

void Release(SchedulerState* state, PodId pod, Outbox* out) {
  auto binding = state->bindings.find(pod);
  if (binding == state->bindings.end()) return;

  for (auto& node : state->nodes) {
    if (node.id == binding->second.node) {
      node.allocated -= binding->second.request;
      break;
    }
  }

  state->bindings.erase(binding);

  for (auto it = state->waiting.begin(); it != state->waiting.end();) {
    if (Place(it->first, it->second, state, out)) {
      VLOG(3) << "scheduler " << out->self() << ": placed waiting pod"
              << it->first;
      it = state->waiting.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace

SchedulerState Scheduler::Init(const system::ClusterConfig& config,
                               ActorId self, Outbox* out) {
  SchedulerState state;

  for (NodeId id = 1; id <= config.nodes; ++id) {
    Node node;
    node.id = id;
    node.capacity = config.node_capacity;
    state.nodes.push_back(node);
  }

  return state;
}

bool Scheduler::Handle(const system::ClusterConfig& config,
                       const Envelope& env, std::size_t choice, State* state,
                       Outbox* out) {
  if (choice != 0) return false;

  const Msg& msg = env.msg;

  switch (msg.type) {
    case Msg::Type::SchedulePod: {
      auto bound = state->bindings.find(msg.pod);
      if (bound != state->bindings.end()) {
        // Already placed by us; repeat the same decision.
        out->Send(kDatastoreId, Msg::MakeBindPod(msg.pod, bound->second.node));
        return true;
      }

      const auto request = PodRequest(msg.cpu, msg.mem);
      if (Place(msg.pod, request, state, out)) {
        state->waiting.erase(msg.pod);
        return true;
      }

      VLOG(3) << "scheduler " << out->self() << ": pod" << msg.pod
              << " fits on no node";
      state->waiting[msg.pod] = request;
      return true;
    }

    case Msg::Type::Response:
      // Only failed bindings are answered.
      if (!msg.ok) Release(state, msg.pod, out);
      return true;

    case Msg::Type::ReleasePod:
      // The pod is gone; it no longer waits either.
      state->waiting.erase(msg.pod);
      Release(state, msg.pod, out);
      return true;

    default:
      throw core::Error("scheduler: unexpected message " + ToString(msg));
  }
}

}  // namespace actor
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
