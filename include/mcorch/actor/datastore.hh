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

#ifndef MCORCH_ACTOR_DATASTORE_HH_
#define MCORCH_ACTOR_DATASTORE_HH_

#include <cstddef>
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "mcorch/actor/resources.hh"
#include "mcorch/actor/types.hh"
#include "mcorch/history/contract.hh"
#include "mcorch/system/config.hh"

namespace mcorch {
namespace actor {

/**
 * Multi-version ordered key-value store.
 *
 * Every effective write commits at a new revision; a key's versions are kept
 * in commit order, so the store can be read as of any past revision. Ranges
 * are half-open [start, end); an empty end denotes the single key start.
 */
struct DatastoreState {
  struct Version {
    bool operator==(const Version& rhs) const {
      return revision == rhs.revision && tombstone == rhs.tombstone &&
             value == rhs.value;
    }

    Revision revision;
    bool tombstone;
    std::string value;
  };

  struct Hash {
    std::size_t operator()(const DatastoreState& k) const;
  };

  bool operator==(const DatastoreState& rhs) const {
    return revision == rhs.revision && data == rhs.data &&
           sessions == rhs.sessions && read_floor == rhs.read_floor;
  }

  //! @return Latest value of key, or nullptr if absent.
  const std::string* Get(const std::string& key) const;

  std::vector<KeyValue> RangeAt(const std::string& start,
                                const std::string& end, Revision at) const;

  //! @return The revision of the write.
  Revision Put(const std::string& key, std::string value);

  /**
   * Deletes all present keys in the range at one revision.
   *
   * @return Number of deleted keys; no revision is committed if 0.
   */
  std::uint32_t DeleteRange(const std::string& start, const std::string& end);

  /**
   * Revisions a read of [start, end) by session may be served from under
   * contract, the latest first. Only one revision per distinct view of the
   * range is returned: the latest view at the current revision, older views
   * at the earliest admissible revision showing them.
   *
   * @param max_older Maximum number of older views.
   */
  std::vector<Revision> ReadableRevisions(history::Contract contract,
                                          ActorId session,
                                          const std::string& start,
                                          const std::string& end,
                                          std::size_t max_older) const;

  //! Highest revision observed by session.
  Revision SessionFloor(ActorId session) const;

  //! Records that session observed revision r.
  void Observe(ActorId session, Revision r, bool read);

  bool GetPod(PodId id, PodRecord* pod) const;

  std::vector<PodRecord> Pods() const;

  std::vector<ReplicasetRecord> Replicasets() const;

  std::map<std::string, std::vector<Version>> data;

  //! Revision of the last commit.
  Revision revision = 0;

  std::map<ActorId, Revision> sessions;

  //! Highest revision any read has been served from.
  Revision read_floor = 0;
};

std::ostream& operator<<(std::ostream& os, const DatastoreState& state);

/**
 * The datastore actor: serves the key-value surface with reads according to
 * ClusterConfig::datastore_reads, and the control-plane requests on the
 * records under kPodPrefix and kReplicasetPrefix, notifying the other actors
 * of changes.
 *
 * Choices: a Range request has one choice per admissible view (0 is the
 * latest); all other messages only choice 0.
 */
struct Datastore {
  typedef DatastoreState State;

  //! Stores the initial replicasets and pods and announces them.
  static State Init(const system::ClusterConfig& config, ActorId self,
                    Outbox* out);

  static bool Handle(const system::ClusterConfig& config, const Envelope& env,
                     std::size_t choice, State* state, Outbox* out);
};

}  // namespace actor
}  // namespace mcorch

#endif /* MCORCH_ACTOR_DATASTORE_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
