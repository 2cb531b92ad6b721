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

#include "mcorch/actor/datastore.hh"

#include <algorithm>
#include <ostream>
#include <string>
#include <utility>

#include <glog/logging.h>

#include "mcorch/core/ts.hh"

namespace mcorch {
namespace actor {

namespace {

bool InRange(const std::string& key, const std::string& start,
             const std::string& end) {
  if (end.empty()) return key == start;
  return start <= key && key < end;
}

bool HasPrefix(const std::string& key, const char* prefix) {
  const std::string p(prefix);
  return key.compare(0, p.size(), p) == 0;
}

std::uint32_t IdFromKey(const std::string& key, const char* prefix) {
  return static_cast<std::uint32_t>(
      std::stoul(key.substr(std::string(prefix).size())));
}

//! @return Latest version of versions at or before at, or nullptr.
const DatastoreState::Version* VersionAt(
    const std::vector<DatastoreState::Version>& versions, Revision at) {
  for (auto it = versions.rbegin(); it != versions.rend(); ++it) {
    if (it->revision <= at) return &*it;
  }
  return nullptr;
}

}  // namespace

std::size_t DatastoreState::Hash::operator()(const DatastoreState& k) const {
  std::size_t h = k.revision;
  for (const auto& kv : k.data) {
    CombineHash(kv.first, &h);
    for (const auto& v : kv.second) {
      CombineHash(v.revision, &h);
      CombineHash(v.tombstone, &h);
      CombineHash(v.value, &h);
    }
  }
  for (const auto& kv : k.sessions) {
    CombineHash(kv.first, &h);
    CombineHash(kv.second, &h);
  }
  CombineHash(k.read_floor, &h);
  return h;
}

const std::string* DatastoreState::Get(const std::string& key) const {
  auto it = data.find(key);
  if (it == data.end() || it->second.empty() || it->second.back().tombstone) {
    return nullptr;
  }
  return &it->second.back().value;
}

std::vector<KeyValue> DatastoreState::RangeAt(const std::string& start,
                                              const std::string& end,
                                              Revision at) const {
  std::vector<KeyValue> result;

  for (auto it = data.lower_bound(start);
       it != data.end() && InRange(it->first, start, end); ++it) {
    const auto version = VersionAt(it->second, at);
    if (version != nullptr && !version->tombstone) {
      result.push_back(KeyValue{it->first, version->value});
    }
  }

  return result;
}

Revision DatastoreState::Put(const std::string& key, std::string value) {
  data[key].push_back(Version{++revision, false, std::move(value)});
  return revision;
}

std::uint32_t DatastoreState::DeleteRange(const std::string& start,
                                          const std::string& end) {
  std::vector<std::string> keys;
  for (auto it = data.lower_bound(start);
       it != data.end() && InRange(it->first, start, end); ++it) {
    if (!it->second.empty() && !it->second.back().tombstone) {
      keys.push_back(it->first);
    }
  }

  if (keys.empty()) return 0;

  ++revision;
  for (const auto& key : keys) {
    data[key].push_back(Version{revision, true, std::string()});
  }

  return static_cast<std::uint32_t>(keys.size());
}

std::vector<Revision> DatastoreState::ReadableRevisions(
    history::Contract contract, ActorId session, const std::string& start,
    const std::string& end, std::size_t max_older) const {
  std::vector<Revision> result{revision};

  Revision floor = revision;
  switch (contract) {
    case history::Contract::Linearizable:
      return result;
    case history::Contract::Session:
      floor = SessionFloor(session);
      break;
    case history::Contract::MonotonicSession:
      floor = std::max(SessionFloor(session), read_floor);
      break;
  }
  floor = std::min(floor, revision);

  // Revisions at which the view of the range changed.
  std::vector<Revision> writes;
  for (auto it = data.lower_bound(start);
       it != data.end() && InRange(it->first, start, end); ++it) {
    for (const auto& v : it->second) {
      writes.push_back(v.revision);
    }
  }
  std::sort(writes.begin(), writes.end());
  writes.erase(std::unique(writes.begin(), writes.end()), writes.end());

  // The view at writes[i - 1] lasts until writes[i] - 1.
  for (std::size_t i = writes.size(); i-- > 0 && result.size() <= max_older;) {
    if (writes[i] == 0 || writes[i] - 1 < floor) break;
    const Revision view_start = i > 0 ? writes[i - 1] : 0;
    result.push_back(std::max(view_start, floor));
  }

  return result;
}

Revision DatastoreState::SessionFloor(ActorId session) const {
  auto it = sessions.find(session);
  return it != sessions.end() ? it->second : 0;
}

void DatastoreState::Observe(ActorId session, Revision r, bool read) {
  auto& floor = sessions[session];
  floor = std::max(floor, r);
  if (read) read_floor = std::max(read_floor, r);
}

bool DatastoreState::GetPod(PodId id, PodRecord* pod) const {
  const auto value = Get(PodKey(id));
  if (value == nullptr) return false;
  *pod = DecodePod(id, *value);
  return true;
}

std::vector<PodRecord> DatastoreState::Pods() const {
  std::vector<PodRecord> result;
  for (auto it = data.lower_bound(kPodPrefix);
       it != data.end() && HasPrefix(it->first, kPodPrefix); ++it) {
    if (it->second.empty() || it->second.back().tombstone) continue;
    result.push_back(DecodePod(IdFromKey(it->first, kPodPrefix),
                               it->second.back().value));
  }
  return result;
}

std::vector<ReplicasetRecord> DatastoreState::Replicasets() const {
  std::vector<ReplicasetRecord> result;
  for (auto it = data.lower_bound(kReplicasetPrefix);
       it != data.end() && HasPrefix(it->first, kReplicasetPrefix); ++it) {
    if (it->second.empty() || it->second.back().tombstone) continue;
    result.push_back(DecodeReplicaset(IdFromKey(it->first, kReplicasetPrefix),
                                      it->second.back().value));
  }
  return result;
}

std::ostream& operator<<(std::ostream& os, const DatastoreState& state) {
  os << " |   revision = " << state.revision << std::endl;

  for (const auto& kv : state.data) {
    if (kv.second.empty() || kv.second.back().tombstone) continue;
    os << " |   " << kv.first << " = " << kv.second.back().value << " @"
       << kv.second.back().revision << std::endl;
  }

  if (!state.sessions.empty()) {
    os << " |   sessions =";
    for (const auto& kv : state.sessions) {
      os << " " << kv.first << "@" << kv.second;
    }
    os << " | read floor @" << state.read_floor << std::endl;
  }

  return os;
}

namespace {

void Broadcast(const std::vector<ActorId>& dsts, const Msg& msg, Outbox* out) {
  for (const auto dst : dsts) {
    out->Send(dst, msg);
  }
}

//! Writes pod and tells the owner's controllers.
void StorePod(const system::ClusterConfig& config, const PodRecord& pod,
              DatastoreState* state, Outbox* out) {
  const auto rev = state->Put(PodKey(pod.id), EncodePod(pod));
  if (pod.owner != 0) {
    Broadcast(config.ControllerIds(),
              Msg::MakePodChanged(pod.owner, pod.id, pod.phase, rev), out);
  }
}

void RemovePod(const system::ClusterConfig& config, const PodRecord& pod,
               DatastoreState* state, Outbox* out) {
  state->DeleteRange(PodKey(pod.id), "");
  if (pod.owner != 0) {
    Broadcast(config.ControllerIds(),
              Msg::MakePodChanged(pod.owner, pod.id, PodPhase::Terminated,
                                  state->revision),
              out);
  }
}

void CreatePod(const system::ClusterConfig& config, const PodRecord& pod,
               DatastoreState* state, Outbox* out) {
  StorePod(config, pod, state, out);
  Broadcast(config.SchedulerIds(),
            Msg::MakeSchedulePod(pod.id, pod.cpu, pod.mem), out);
}

void StoreReplicaset(const system::ClusterConfig& config,
                     const ReplicasetRecord& rs, DatastoreState* state,
                     Outbox* out) {
  const auto rev = state->Put(ReplicasetKey(rs.id), EncodeReplicaset(rs));
  Broadcast(config.ControllerIds(),
            Msg::MakeReplicasetChanged(rs.id, rs.replicas, rev), out);
}

bool HandleKv(const system::ClusterConfig& config, const Envelope& env,
              std::size_t choice, DatastoreState* state, Outbox* out) {
  const Msg& msg = env.msg;

  if (msg.type == Msg::Type::Range) {
    const auto revisions = state->ReadableRevisions(
        config.datastore_reads, env.src, msg.key, msg.end, config.read_choices);
    if (choice >= revisions.size()) return false;

    const auto at = revisions[choice];
    VLOG(3) << "datastore: range [" << msg.key << ", " << msg.end << ") for "
            << env.src << " at revision " << at << " of " << state->revision;
    state->Observe(env.src, at, true);

    auto response = Msg::MakeResponse(true, at);
    response.entries = state->RangeAt(msg.key, msg.end, at);
    out->Reply(env, std::move(response));
    return true;
  }

  if (choice != 0) return false;

  if (msg.type == Msg::Type::Put) {
    if (msg.create_only && state->Get(msg.key) != nullptr) {
      out->Reply(env, Msg::MakeResponse(false, state->revision));
      return true;
    }

    const auto rev = state->Put(msg.key, msg.value);
    state->Observe(env.src, rev, false);
    out->Reply(env, Msg::MakeResponse(true, rev));
    return true;
  }

  // DeleteRange
  auto response = Msg::MakeResponse(true, state->revision);
  response.count = state->DeleteRange(msg.key, msg.end);
  if (response.count != 0) {
    response.revision = state->revision;
    state->Observe(env.src, state->revision, false);
  }
  out->Reply(env, std::move(response));
  return true;
}

}  // namespace

DatastoreState Datastore::Init(const system::ClusterConfig& config,
                               ActorId self, Outbox* out) {
  DatastoreState state;

  for (ReplicasetId id = 1; id <= config.initial_replicasets; ++id) {
    ReplicasetRecord rs;
    rs.id = id;
    rs.replicas = config.initial_replicas;
    StoreReplicaset(config, rs, &state, out);
  }

  for (std::uint32_t i = 0; i < config.initial_pods; ++i) {
    PodRecord pod;
    pod.id = MakePodId(0, 60000 + i);
    pod.cpu = config.pod_cpu;
    pod.mem = config.pod_mem;
    CreatePod(config, pod, &state, out);
  }

  return state;
}

bool Datastore::Handle(const system::ClusterConfig& config,
                       const Envelope& env, std::size_t choice, State* state,
                       Outbox* out) {
  const Msg& msg = env.msg;

  if (msg.IsKvRequest()) {
    return HandleKv(config, env, choice, state, out);
  }

  if (choice != 0) return false;

  PodRecord pod;
  const bool pod_exists = state->GetPod(msg.pod, &pod);

  switch (msg.type) {
    case Msg::Type::CreateReplicaset:
      if (state->Get(ReplicasetKey(msg.replicaset)) == nullptr) {
        StoreReplicaset(config,
                        ReplicasetRecord{msg.replicaset, msg.replicas}, state,
                        out);
      }
      return true;

    case Msg::Type::ScaleReplicaset: {
      const auto value = state->Get(ReplicasetKey(msg.replicaset));
      if (value != nullptr &&
          DecodeReplicaset(msg.replicaset, *value).replicas != msg.replicas) {
        StoreReplicaset(config,
                        ReplicasetRecord{msg.replicaset, msg.replicas}, state,
                        out);
      }
      return true;
    }

    case Msg::Type::CreatePod:
      if (!pod_exists) {
        pod.id = msg.pod;
        pod.owner = msg.replicaset;
        pod.cpu = msg.cpu;
        pod.mem = msg.mem;
        pod.phase = PodPhase::Pending;
        pod.node = 0;
        CreatePod(config, pod, state, out);
      }
      return true;

    case Msg::Type::DeletePod:
      if (!pod_exists) return true;

      if (pod.phase == PodPhase::Pending) {
        RemovePod(config, pod, state, out);
      } else if (pod.phase == PodPhase::Scheduled ||
                 pod.phase == PodPhase::Running) {
        pod.phase = PodPhase::Terminating;
        StorePod(config, pod, state, out);
        out->Send(kKubeletId, Msg::MakeStopPod(pod.id, pod.node));
      }
      return true;

    case Msg::Type::BindPod:
      if (msg.node == 0 || msg.node > config.nodes) {
        throw core::Error("datastore: bind to unknown node " +
                          ToString(msg));
      }

      if (pod_exists && pod.phase == PodPhase::Pending) {
        pod.phase = PodPhase::Scheduled;
        pod.node = msg.node;
        StorePod(config, pod, state, out);
        out->Send(kKubeletId, Msg::MakeStartPod(pod.id, pod.node));
      } else if (!pod_exists || !IsBound(pod.phase) || pod.node != msg.node) {
        auto response = Msg::MakeResponse(false, state->revision);
        response.pod = msg.pod;
        out->Reply(env, std::move(response));
      }
      return true;

    case Msg::Type::PodRunning:
      if (pod_exists && pod.phase == PodPhase::Scheduled) {
        pod.phase = PodPhase::Running;
        StorePod(config, pod, state, out);
      }
      return true;

    case Msg::Type::PodStopped:
      if (pod_exists && pod.phase == PodPhase::Terminating) {
        RemovePod(config, pod, state, out);
        Broadcast(config.SchedulerIds(), Msg::MakeReleasePod(pod.id), out);

        // Capacity was freed: offer pending pods again.
        for (const auto& pending : state->Pods()) {
          if (pending.phase != PodPhase::Pending) continue;
          Broadcast(config.SchedulerIds(),
                    Msg::MakeSchedulePod(pending.id, pending.cpu, pending.mem),
                    out);
        }
      }
      return true;

    default:
      throw core::Error("datastore: unexpected message " + ToString(msg));
  }
}

}  // namespace actor
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
