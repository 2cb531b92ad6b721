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

#include "mcorch/actor/resources.hh"

#include <cstdio>
#include <sstream>
#include <string>

#include <gsl/gsl>

#include "mcorch/core/ts.hh"

namespace mcorch {
namespace actor {

const char* const kPodPrefix = "pods/";
const char* const kReplicasetPrefix = "replicasets/";
const char* const kKvPrefix = "kv/";

Resources& Resources::operator-=(const Resources& rhs) {
  Expects(rhs.FitsIn(*this));
  cpu -= rhs.cpu;
  mem -= rhs.mem;
  pods -= rhs.pods;
  return *this;
}

std::ostream& operator<<(std::ostream& os, const Resources& r) {
  return os << "cpu " << r.cpu << ", mem " << r.mem << ", pods " << r.pods;
}

namespace {

std::string PaddedKey(const char* prefix, std::uint32_t id) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%010u", id);
  return std::string(prefix) + buf;
}

}  // namespace

std::string PodKey(PodId pod) { return PaddedKey(kPodPrefix, pod); }

std::string ReplicasetKey(ReplicasetId rs) {
  return PaddedKey(kReplicasetPrefix, rs);
}

std::string PrefixEnd(const std::string& prefix) {
  std::string end = prefix;
  while (!end.empty()) {
    if (static_cast<unsigned char>(end.back()) != 0xff) {
      ++end.back();
      return end;
    }
    end.pop_back();
  }

  // Prefix of only 0xff bytes (or empty): no upper bound.
  return std::string();
}

std::string EncodePod(const PodRecord& pod) {
  std::ostringstream oss;
  oss << pod.owner << ',' << pod.cpu << ',' << pod.mem << ','
      << static_cast<unsigned>(pod.phase) << ',' << pod.node;
  return oss.str();
}

PodRecord DecodePod(PodId id, const std::string& value) {
  PodRecord pod;
  pod.id = id;

  unsigned phase = 0;
  char sep[4];
  std::istringstream iss(value);
  iss >> pod.owner >> sep[0] >> pod.cpu >> sep[1] >> pod.mem >> sep[2] >>
      phase >> sep[3] >> pod.node;

  if (!iss || sep[0] != ',' || sep[1] != ',' || sep[2] != ',' ||
      sep[3] != ',' ||
      phase > static_cast<unsigned>(PodPhase::Terminated)) {
    throw core::Error("malformed pod record: " + value);
  }

  pod.phase = static_cast<PodPhase>(phase);
  return pod;
}

std::string EncodeReplicaset(const ReplicasetRecord& rs) {
  return std::to_string(rs.replicas);
}

ReplicasetRecord DecodeReplicaset(ReplicasetId id, const std::string& value) {
  ReplicasetRecord rs;
  rs.id = id;

  std::istringstream iss(value);
  if (!(iss >> rs.replicas)) {
    throw core::Error("malformed replicaset record: " + value);
  }

  return rs;
}

}  // namespace actor
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
