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

#include "mcorch/actor/types.hh"

#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace mcorch {
namespace actor {

Msg Msg::MakeRange(std::string key, std::string end) {
  Msg m;
  m.type = Type::Range;
  m.key = std::move(key);
  m.end = std::move(end);
  return m;
}

Msg Msg::MakePut(std::string key, std::string value, bool create_only) {
  Msg m;
  m.type = Type::Put;
  m.key = std::move(key);
  m.value = std::move(value);
  m.create_only = create_only;
  return m;
}

Msg Msg::MakeDeleteRange(std::string key, std::string end) {
  Msg m;
  m.type = Type::DeleteRange;
  m.key = std::move(key);
  m.end = std::move(end);
  return m;
}

Msg Msg::MakeResponse(bool ok, Revision revision) {
  Msg m;
  m.type = Type::Response;
  m.ok = ok;
  m.revision = revision;
  return m;
}

Msg Msg::MakeCreateReplicaset(ReplicasetId rs, std::uint32_t replicas) {
  Msg m;
  m.type = Type::CreateReplicaset;
  m.replicaset = rs;
  m.replicas = replicas;
  return m;
}

Msg Msg::MakeScaleReplicaset(ReplicasetId rs, std::uint32_t replicas) {
  Msg m;
  m.type = Type::ScaleReplicaset;
  m.replicaset = rs;
  m.replicas = replicas;
  return m;
}

Msg Msg::MakeCreatePod(PodId pod, ReplicasetId owner, std::uint32_t cpu,
                       std::uint32_t mem) {
  Msg m;
  m.type = Type::CreatePod;
  m.pod = pod;
  m.replicaset = owner;
  m.cpu = cpu;
  m.mem = mem;
  return m;
}

Msg Msg::MakeDeletePod(PodId pod) {
  Msg m;
  m.type = Type::DeletePod;
  m.pod = pod;
  return m;
}

Msg Msg::MakeBindPod(PodId pod, NodeId node) {
  Msg m;
  m.type = Type::BindPod;
  m.pod = pod;
  m.node = node;
  return m;
}

Msg Msg::MakePodRunning(PodId pod) {
  Msg m;
  m.type = Type::PodRunning;
  m.pod = pod;
  return m;
}

Msg Msg::MakePodStopped(PodId pod) {
  Msg m;
  m.type = Type::PodStopped;
  m.pod = pod;
  return m;
}

Msg Msg::MakeReplicasetChanged(ReplicasetId rs, std::uint32_t replicas,
                               Revision revision) {
  Msg m;
  m.type = Type::ReplicasetChanged;
  m.replicaset = rs;
  m.replicas = replicas;
  m.revision = revision;
  return m;
}

Msg Msg::MakePodChanged(ReplicasetId rs, PodId pod, PodPhase phase,
                        Revision revision) {
  Msg m;
  m.type = Type::PodChanged;
  m.replicaset = rs;
  m.pod = pod;
  m.phase = phase;
  m.revision = revision;
  return m;
}

Msg Msg::MakeSchedulePod(PodId pod, std::uint32_t cpu, std::uint32_t mem) {
  Msg m;
  m.type = Type::SchedulePod;
  m.pod = pod;
  m.cpu = cpu;
  m.mem = mem;
  return m;
}

Msg Msg::MakeReleasePod(PodId pod) {
  Msg m;
  m.type = Type::ReleasePod;
  m.pod = pod;
  return m;
}

Msg Msg::MakeStartPod(PodId pod, NodeId node) {
  Msg m;
  m.type = Type::StartPod;
  m.pod = pod;
  m.node = node;
  return m;
}

Msg Msg::MakeStopPod(PodId pod, NodeId node) {
  Msg m;
  m.type = Type::StopPod;
  m.pod = pod;
  m.node = node;
  return m;
}

std::ostream& operator<<(std::ostream& os, const Msg& msg) {
  os << msg.type << "(";

  switch (msg.type) {
    case Msg::Type::Range:
    case Msg::Type::DeleteRange:
      os << msg.key << ", " << msg.end;
      break;
    case Msg::Type::Put:
      os << msg.key << ", " << msg.value << (msg.create_only ? ", new" : "");
      break;
    case Msg::Type::Response:
      os << (msg.ok ? "ok" : "failed") << ", @" << msg.revision;
      if (msg.count != 0) os << ", deleted " << msg.count;
      for (const auto& kv : msg.entries) {
        os << ", " << kv;
      }
      break;
    case Msg::Type::CreateReplicaset:
    case Msg::Type::ScaleReplicaset:
      os << "rs" << msg.replicaset << ", " << msg.replicas;
      break;
    case Msg::Type::ReplicasetChanged:
      os << "rs" << msg.replicaset << ", " << msg.replicas << ", @"
         << msg.revision;
      break;
    case Msg::Type::CreatePod:
      os << "pod" << msg.pod << ", rs" << msg.replicaset << ", " << msg.cpu
         << "/" << msg.mem;
      break;
    case Msg::Type::SchedulePod:
      os << "pod" << msg.pod << ", " << msg.cpu << "/" << msg.mem;
      break;
    case Msg::Type::PodChanged:
      os << "rs" << msg.replicaset << ", pod" << msg.pod << ", " << msg.phase
         << ", @" << msg.revision;
      break;
    case Msg::Type::BindPod:
    case Msg::Type::StartPod:
    case Msg::Type::StopPod:
      os << "pod" << msg.pod << ", node" << msg.node;
      break;
    case Msg::Type::DeletePod:
    case Msg::Type::PodRunning:
    case Msg::Type::PodStopped:
    case Msg::Type::ReleasePod:
      os << "pod" << msg.pod;
      break;
  }

  return os << ")";
}

std::string ToString(const Msg& msg) {
  std::ostringstream oss;
  oss << msg;
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Envelope& env) {
  os << env.src << " -> " << env.dst;
  if (env.op != kNoOp) os << " [op " << env.op << "]";
  return os << ": " << env.msg;
}

}  // namespace actor
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
