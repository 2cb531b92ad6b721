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

#ifndef MCORCH_ACTOR_TYPES_HH_
#define MCORCH_ACTOR_TYPES_HH_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "mcorch/util.hh"

namespace mcorch {
namespace actor {

typedef std::uint32_t ActorId;
typedef std::uint64_t Revision;
typedef std::uint64_t OpId;
typedef std::uint32_t NodeId;
typedef std::uint32_t PodId;
typedef std::uint32_t ReplicasetId;

constexpr ActorId kDatastoreId = 0;
constexpr ActorId kKubeletId = 1;

//! Operation id of messages that are not recorded in the history.
constexpr OpId kNoOp = 0;

PRINTABLE_ENUM_CLASS(ActorKind, inline, Datastore, Kubelet, Scheduler,
                     ReplicasetController, Client);

PRINTABLE_ENUM_CLASS(PodPhase, inline, Pending, Scheduled, Running,
                     Terminating, Terminated);

/**
 * @return true if a pod in this phase counts towards its replicaset's current
 *    scale.
 */
inline bool IsActive(PodPhase phase) {
  return phase == PodPhase::Pending || phase == PodPhase::Scheduled ||
         phase == PodPhase::Running;
}

//! @return true if a pod in this phase occupies resources on its node.
inline bool IsBound(PodPhase phase) {
  return phase == PodPhase::Scheduled || phase == PodPhase::Running ||
         phase == PodPhase::Terminating;
}

struct KeyValue {
  struct Hash {
    std::size_t operator()(const KeyValue& k) const {
      std::size_t h = 0;
      CombineHash(k.key, &h);
      CombineHash(k.value, &h);
      return h;
    }
  };

  bool operator==(const KeyValue& rhs) const {
    return key == rhs.key && value == rhs.value;
  }

  bool operator<(const KeyValue& rhs) const {
    return std::tie(key, value) < std::tie(rhs.key, rhs.value);
  }

  std::string key;
  std::string value;
};

inline std::ostream& operator<<(std::ostream& os, const KeyValue& kv) {
  return os << kv.key << "=" << kv.value;
}

/**
 * Message payload: a tagged struct. Only the fields relevant to a type are
 * set; all others keep their default values, so that equal payloads compare
 * equal.
 */
struct Msg {
  PRINTABLE_ENUM_CLASS(Type, friend,
                       // Key-value surface of the datastore.
                       Range, Put, DeleteRange, Response,
                       // Control-plane requests to the datastore.
                       CreateReplicaset, ScaleReplicaset, CreatePod, DeletePod,
                       BindPod, PodRunning, PodStopped,
                       // Notifications from the datastore.
                       ReplicasetChanged, PodChanged, SchedulePod, ReleasePod,
                       StartPod, StopPod);

  struct Hash {
    std::size_t operator()(const Msg& k) const {
      std::size_t h = 0;
      CombineHash(k.type, &h);
      CombineHash(k.key, &h);
      CombineHash(k.end, &h);
      CombineHash(k.value, &h);
      CombineHash(k.create_only, &h);
      CombineHash(k.ok, &h);
      CombineHash(k.revision, &h);
      CombineHash(k.count, &h);
      CombineHashRange(k.entries.begin(), k.entries.end(), &h);
      CombineHash(k.pod, &h);
      CombineHash(k.node, &h);
      CombineHash(k.replicaset, &h);
      CombineHash(k.replicas, &h);
      CombineHash(k.cpu, &h);
      CombineHash(k.mem, &h);
      CombineHash(k.phase, &h);
      return h;
    }
  };

  static Msg MakeRange(std::string key, std::string end);
  static Msg MakePut(std::string key, std::string value,
                     bool create_only = false);
  static Msg MakeDeleteRange(std::string key, std::string end);
  static Msg MakeResponse(bool ok, Revision revision);
  static Msg MakeCreateReplicaset(ReplicasetId rs, std::uint32_t replicas);
  static Msg MakeScaleReplicaset(ReplicasetId rs, std::uint32_t replicas);
  static Msg MakeCreatePod(PodId pod, ReplicasetId owner, std::uint32_t cpu,
                           std::uint32_t mem);
  static Msg MakeDeletePod(PodId pod);
  static Msg MakeBindPod(PodId pod, NodeId node);
  static Msg MakePodRunning(PodId pod);
  static Msg MakePodStopped(PodId pod);
  static Msg MakeReplicasetChanged(ReplicasetId rs, std::uint32_t replicas,
                                   Revision revision);
  static Msg MakePodChanged(ReplicasetId rs, PodId pod, PodPhase phase,
                            Revision revision);
  static Msg MakeSchedulePod(PodId pod, std::uint32_t cpu, std::uint32_t mem);
  static Msg MakeReleasePod(PodId pod);
  static Msg MakeStartPod(PodId pod, NodeId node);
  static Msg MakeStopPod(PodId pod, NodeId node);

  //! @return true for requests of the key-value surface.
  bool IsKvRequest() const {
    return type == Type::Range || type == Type::Put ||
           type == Type::DeleteRange;
  }

  Type type = Type::Response;
  std::string key;
  std::string end;
  std::string value;
  bool create_only = false;
  bool ok = false;
  Revision revision = 0;
  std::uint32_t count = 0;
  std::vector<KeyValue> entries;
  PodId pod = 0;
  NodeId node = 0;
  ReplicasetId replicaset = 0;
  std::uint32_t replicas = 0;
  std::uint32_t cpu = 0;
  std::uint32_t mem = 0;
  PodPhase phase = PodPhase::Pending;

 private:
  auto Tie() const {
    return std::tie(type, key, end, value, create_only, ok, revision, count,
                    entries, pod, node, replicaset, replicas, cpu, mem, phase);
  }

 public:
  // Defined after Tie(), whose return type must be deduced before use.
  bool operator==(const Msg& rhs) const { return Tie() == rhs.Tie(); }

  bool operator<(const Msg& rhs) const { return Tie() < rhs.Tie(); }
};

std::ostream& operator<<(std::ostream& os, const Msg& msg);

std::string ToString(const Msg& msg);

struct Envelope {
  struct Hash {
    std::size_t operator()(const Envelope& k) const {
      std::size_t h = 0;
      CombineHash(k.src, &h);
      CombineHash(k.dst, &h);
      CombineHash(k.op, &h);
      CombineHash(k.msg, &h);
      return h;
    }
  };

  bool operator==(const Envelope& rhs) const {
    return src == rhs.src && dst == rhs.dst && op == rhs.op && msg == rhs.msg;
  }

  bool operator<(const Envelope& rhs) const {
    return std::tie(src, dst, op, msg) <
           std::tie(rhs.src, rhs.dst, rhs.op, rhs.msg);
  }

  ActorId src;
  ActorId dst;
  OpId op;
  Msg msg;
};

std::ostream& operator<<(std::ostream& os, const Envelope& env);

/**
 * Boundary to a message transport. The model checker delivers messages via
 * its network model; a deployment of the actors against a real cluster
 * provides its own implementation.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  virtual void Send(Envelope env) = 0;
};

/**
 * Collects the messages emitted by one handler invocation.
 */
class Outbox : public Transport {
 public:
  explicit Outbox(ActorId self) : self_(self) {}

  void Send(Envelope env) override { sent_.emplace_back(std::move(env)); }

  void Send(ActorId dst, Msg msg) {
    Send(Envelope{self_, dst, kNoOp, std::move(msg)});
  }

  //! Responds to request, preserving its operation id.
  void Reply(const Envelope& request, Msg msg) {
    Send(Envelope{self_, request.src, request.op, std::move(msg)});
  }

  ActorId self() const { return self_; }

  std::vector<Envelope>& sent() { return sent_; }

  const std::vector<Envelope>& sent() const { return sent_; }

 private:
  ActorId self_;
  std::vector<Envelope> sent_;
};

}  // namespace actor
}  // namespace mcorch

#endif /* MCORCH_ACTOR_TYPES_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
