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

#include "mcorch/system/state.hh"

#include <ostream>
#include <utility>

#include <glog/logging.h>

#include "mcorch/core/ts.hh"

namespace mcorch {
namespace system {

using actor::ActorId;
using actor::ActorKind;
using actor::Envelope;
using actor::Outbox;

namespace {

template <class Actor>
bool HandleWith(const ClusterConfig& config,
                core::Ref<typename Actor::State>* state, const Envelope& env,
                std::size_t choice, Outbox* out) {
  return Actor::Handle(config, env, choice, state->Mut(), out);
}

template <class Actor>
core::Ref<typename Actor::State> InitWith(const ClusterConfig& config,
                                          ActorId self, Outbox* out) {
  return core::Ref<typename Actor::State>(Actor::Init(config, self, out));
}

}  // namespace

SystemState::SystemState(std::shared_ptr<const ClusterConfig> config)
    : config_(std::move(config)),
      network_(config_->net_capacity, config_->faults) {
  std::vector<Outbox> outboxes;

  outboxes.emplace_back(actor::kDatastoreId);
  datastore_ = InitWith<actor::Datastore>(*config_, actor::kDatastoreId,
                                          &outboxes.back());

  outboxes.emplace_back(actor::kKubeletId);
  kubelet_ =
      InitWith<actor::Kubelet>(*config_, actor::kKubeletId, &outboxes.back());

  for (std::uint32_t i = 0; i < config_->schedulers; ++i) {
    outboxes.emplace_back(config_->SchedulerId(i));
    schedulers_.push_back(InitWith<actor::Scheduler>(
        *config_, config_->SchedulerId(i), &outboxes.back()));
  }

  for (std::uint32_t i = 0; i < config_->replicaset_controllers; ++i) {
    outboxes.emplace_back(config_->ControllerId(i));
    controllers_.push_back(InitWith<actor::ReplicasetController>(
        *config_, config_->ControllerId(i), &outboxes.back()));
  }

  for (std::uint32_t i = 0; i < config_->clients; ++i) {
    outboxes.emplace_back(config_->ClientId(i));
    clients_.push_back(InitWith<actor::Client>(*config_, config_->ClientId(i),
                                               &outboxes.back()));
  }

  try {
    for (auto& out : outboxes) {
      Flush(&out);
    }
  } catch (const core::BoundExceeded&) {
    throw ConfigError("net_capacity too small for the initial messages");
  }
}

bool SystemState::Deliver(std::size_t slot, std::size_t choice) {
  if (!network_.Deliverable(slot)) return false;
  return Dispatch(network_.Take(slot), choice);
}

bool SystemState::Drop(std::size_t slot) {
  if (!network_.CanDrop(slot)) return false;
  network_.Drop(slot);
  return true;
}

bool SystemState::Duplicate(std::size_t slot) {
  if (!network_.CanDuplicate(slot)) return false;
  network_.Duplicate(slot);
  return true;
}

bool SystemState::Partition(std::uint64_t group) {
  if (!network_.CanPartition(group)) return false;
  network_.Partition(group);
  return true;
}

bool SystemState::Heal(std::uint64_t group) { return network_.Heal(group); }

bool SystemState::ClientStep(std::uint32_t client, actor::ClientAction action,
                             std::size_t arg) {
  if (client >= clients_.size() ||
      !actor::Client::Enabled(*config_, *clients_[client], action, arg)) {
    return false;
  }

  Outbox out(config_->ClientId(client));
  actor::Client::Act(*config_, action, arg, clients_[client].Mut(), &out);
  Flush(&out);
  return true;
}

bool SystemState::Dispatch(const Envelope& env, std::size_t choice) {
  Outbox out(env.dst);
  bool valid = false;

  const auto kind = config_->KindOf(env.dst);
  switch (kind) {
    case ActorKind::Datastore:
      valid = HandleWith<actor::Datastore>(*config_, &datastore_, env, choice,
                                           &out);
      break;
    case ActorKind::Kubelet:
      valid =
          HandleWith<actor::Kubelet>(*config_, &kubelet_, env, choice, &out);
      break;
    case ActorKind::Scheduler:
      valid = HandleWith<actor::Scheduler>(
          *config_, &schedulers_[config_->IndexOf(env.dst)], env, choice,
          &out);
      break;
    case ActorKind::ReplicasetController:
      valid = HandleWith<actor::ReplicasetController>(
          *config_, &controllers_[config_->IndexOf(env.dst)], env, choice,
          &out);
      break;
    case ActorKind::Client:
      valid = HandleWith<actor::Client>(
          *config_, &clients_[config_->IndexOf(env.dst)], env, choice, &out);
      break;
  }

  if (!valid) return false;

  if (env.op != actor::kNoOp) {
    if (kind == ActorKind::Datastore) {
      for (const auto& sent : out.sent()) {
        if (sent.op == env.op) history_.Mut()->Commit(env.op, sent.msg);
      }
    } else if (kind == ActorKind::Client) {
      history_.Mut()->Complete(env.op);
    }
  }

  Flush(&out);
  return true;
}

void SystemState::Flush(Outbox* out) {
  for (auto& env : out->sent()) {
    if (config_->KindOf(env.src) == ActorKind::Client &&
        env.msg.IsKvRequest()) {
      env.op = history_.Mut()->Invoke(env.src, env.msg);
    }

    VLOG(5) << "send " << env;
    network_.Send(std::move(env));
  }

  out->sent().clear();
}

bool SystemState::operator==(const SystemState& rhs) const {
  return datastore_ == rhs.datastore_ && kubelet_ == rhs.kubelet_ &&
         schedulers_ == rhs.schedulers_ && controllers_ == rhs.controllers_ &&
         clients_ == rhs.clients_ && network_ == rhs.network_ &&
         history_ == rhs.history_;
}

std::size_t SystemState::Hash::operator()(const SystemState& k) const {
  std::size_t h = 0;
  CombineHash(k.datastore_, &h);
  CombineHash(k.kubelet_, &h);
  CombineHashRange(k.schedulers_.begin(), k.schedulers_.end(), &h);
  CombineHashRange(k.controllers_.begin(), k.controllers_.end(), &h);
  CombineHashRange(k.clients_.begin(), k.clients_.end(), &h);
  CombineHash(k.network_, &h);
  CombineHash(k.history_, &h);
  return h;
}

std::ostream& operator<<(std::ostream& os, const SystemState& state) {
  const auto& config = state.config();

  os << " +---< Datastore (" << actor::kDatastoreId << ") >" << std::endl
     << state.datastore();

  os << " +---< Kubelet (" << actor::kKubeletId << ") >" << std::endl
     << state.kubelet();

  for (std::size_t i = 0; i < state.num_schedulers(); ++i) {
    os << " +---< Scheduler[" << i << "] (" << config.SchedulerId(i) << ") >"
       << std::endl
       << state.scheduler(i);
  }

  for (std::size_t i = 0; i < state.num_controllers(); ++i) {
    os << " +---< ReplicasetController[" << i << "] ("
       << config.ControllerId(i) << ") >" << std::endl
       << state.controller(i);
  }

  for (std::size_t i = 0; i < state.num_clients(); ++i) {
    os << " +---< Client[" << i << "] (" << config.ClientId(i) << ") >"
       << std::endl
       << state.client(i);
  }

  os << state.network();

  if (!state.history().empty()) {
    os << " +---< History >" << std::endl << state.history();
  }

  return os;
}

}  // namespace system
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
