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

#ifndef MCORCH_SYSTEM_STATE_HH_
#define MCORCH_SYSTEM_STATE_HH_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <vector>

#include "mcorch/actor/client.hh"
#include "mcorch/actor/datastore.hh"
#include "mcorch/actor/kubelet.hh"
#include "mcorch/actor/network.hh"
#include "mcorch/actor/replicaset.hh"
#include "mcorch/actor/scheduler.hh"
#include "mcorch/core/types.hh"
#include "mcorch/history/history.hh"
#include "mcorch/system/config.hh"

namespace mcorch {
namespace system {

/**
 * Global state of the modelled cluster: the state of every actor, the
 * network, and the history of key-value operations.
 *
 * Actor states and the history are shared between states until modified (see
 * core::Ref); copying a SystemState is cheap. Each action returns false if it
 * is not applicable, in which case the state must be discarded.
 */
class SystemState {
 public:
  struct Hash {
    std::size_t operator()(const SystemState& k) const;
  };

  SystemState() = default;

  /**
   * Initial state: all actors initialized, their initial messages in flight.
   *
   * @throw ConfigError if the initial messages exceed the network capacity.
   */
  explicit SystemState(std::shared_ptr<const ClusterConfig> config);

  //! Quiescent: no message in flight; completes a path.
  bool Accept() const { return network_.empty(); }

  /**
   * Delivers the message in slot, handled with the given choice.
   *
   * @throw core::BoundExceeded if the emitted messages exceed the network
   *    capacity.
   * @throw core::Error if the recipient rejects the message as unexpected.
   */
  bool Deliver(std::size_t slot, std::size_t choice);

  bool Drop(std::size_t slot);

  //! @throw core::BoundExceeded if the network is at capacity.
  bool Duplicate(std::size_t slot);

  bool Partition(std::uint64_t group);

  bool Heal(std::uint64_t group);

  //! @throw core::BoundExceeded if the network is at capacity.
  bool ClientStep(std::uint32_t client, actor::ClientAction action,
                  std::size_t arg);

  const ClusterConfig& config() const { return *config_; }

  const actor::DatastoreState& datastore() const { return *datastore_; }

  const actor::KubeletState& kubelet() const { return *kubelet_; }

  const actor::SchedulerState& scheduler(std::size_t i) const {
    return *schedulers_.at(i);
  }

  const actor::ReplicasetControllerState& controller(std::size_t i) const {
    return *controllers_.at(i);
  }

  const actor::ClientState& client(std::size_t i) const {
    return *clients_.at(i);
  }

  std::size_t num_schedulers() const { return schedulers_.size(); }

  std::size_t num_controllers() const { return controllers_.size(); }

  std::size_t num_clients() const { return clients_.size(); }

  const actor::Network& network() const { return network_; }

  const history::History& history() const { return *history_; }

  bool operator==(const SystemState& rhs) const;

 private:
  bool Dispatch(const actor::Envelope& env, std::size_t choice);

  //! Records requests and sends all messages of out.
  void Flush(actor::Outbox* out);

  std::shared_ptr<const ClusterConfig> config_;
  core::Ref<actor::DatastoreState> datastore_;
  core::Ref<actor::KubeletState> kubelet_;
  std::vector<core::Ref<actor::SchedulerState>> schedulers_;
  std::vector<core::Ref<actor::ReplicasetControllerState>> controllers_;
  std::vector<core::Ref<actor::ClientState>> clients_;
  actor::Network network_;
  core::Ref<history::History> history_;
};

std::ostream& operator<<(std::ostream& os, const SystemState& state);

}  // namespace system
}  // namespace mcorch

#endif /* MCORCH_SYSTEM_STATE_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
