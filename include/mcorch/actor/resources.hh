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

#ifndef MCORCH_ACTOR_RESOURCES_HH_
#define MCORCH_ACTOR_RESOURCES_HH_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include "mcorch/actor/types.hh"

namespace mcorch {
namespace actor {

struct Resources {
  struct Hash {
    std::size_t operator()(const Resources& k) const {
      std::size_t h = 0;
      CombineHash(k.cpu, &h);
      CombineHash(k.mem, &h);
      CombineHash(k.pods, &h);
      return h;
    }
  };

  bool operator==(const Resources& rhs) const {
    return cpu == rhs.cpu && mem == rhs.mem && pods == rhs.pods;
  }

  //! @return true if every dimension of this is <= the one of rhs.
  bool FitsIn(const Resources& rhs) const {
    return cpu <= rhs.cpu && mem <= rhs.mem && pods <= rhs.pods;
  }

  Resources& operator+=(const Resources& rhs) {
    cpu += rhs.cpu;
    mem += rhs.mem;
    pods += rhs.pods;
    return *this;
  }

  //! @pre rhs.FitsIn(*this)
  Resources& operator-=(const Resources& rhs);

  std::uint32_t cpu = 0;
  std::uint32_t mem = 0;
  std::uint32_t pods = 0;
};

std::ostream& operator<<(std::ostream& os, const Resources& r);

//! The resources taken by one pod.
inline Resources PodRequest(std::uint32_t cpu, std::uint32_t mem) {
  Resources r;
  r.cpu = cpu;
  r.mem = mem;
  r.pods = 1;
  return r;
}

struct Node {
  struct Hash {
    std::size_t operator()(const Node& k) const {
      std::size_t h = k.id;
      CombineHash(k.capacity, &h);
      CombineHash(k.allocated, &h);
      return h;
    }
  };

  bool operator==(const Node& rhs) const {
    return id == rhs.id && capacity == rhs.capacity &&
           allocated == rhs.allocated;
  }

  bool Fits(const Resources& request) const {
    Resources total = allocated;
    total += request;
    return total.FitsIn(capacity);
  }

  bool OverCommitted() const { return !allocated.FitsIn(capacity); }

  NodeId id = 0;
  Resources capacity;
  Resources allocated;
};

/**
 * A pod as stored in the datastore (under PodKey).
 */
struct PodRecord {
  bool operator==(const PodRecord& rhs) const {
    return id == rhs.id && owner == rhs.owner && cpu == rhs.cpu &&
           mem == rhs.mem && phase == rhs.phase && node == rhs.node;
  }

  PodId id = 0;
  ReplicasetId owner = 0;
  std::uint32_t cpu = 0;
  std::uint32_t mem = 0;
  PodPhase phase = PodPhase::Pending;
  NodeId node = 0;
};

/**
 * A replicaset as stored in the datastore (under ReplicasetKey).
 */
struct ReplicasetRecord {
  ReplicasetId id = 0;
  std::uint32_t replicas = 0;
};

extern const char* const kPodPrefix;
extern const char* const kReplicasetPrefix;
extern const char* const kKvPrefix;

std::string PodKey(PodId pod);

std::string ReplicasetKey(ReplicasetId rs);

//! @return The smallest key greater than all keys starting with prefix.
std::string PrefixEnd(const std::string& prefix);

std::string EncodePod(const PodRecord& pod);

//! @throw core::Error on a malformed record.
PodRecord DecodePod(PodId id, const std::string& value);

std::string EncodeReplicaset(const ReplicasetRecord& rs);

//! @throw core::Error on a malformed record.
ReplicasetRecord DecodeReplicaset(ReplicasetId id, const std::string& value);

//! Pod ids carry their owner in the upper 16 bits, and an ordinal below.
inline PodId MakePodId(ReplicasetId owner, std::uint32_t ordinal) {
  return (owner << 16) | (ordinal & 0xffff);
}

inline ReplicasetId PodOwner(PodId pod) { return pod >> 16; }

inline std::uint32_t PodOrdinal(PodId pod) { return pod & 0xffff; }

}  // namespace actor
}  // namespace mcorch

#endif /* MCORCH_ACTOR_RESOURCES_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
