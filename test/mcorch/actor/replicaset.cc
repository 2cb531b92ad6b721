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

// Include tested header first, to assert it includes required headers itself!
#include "mcorch/actor/replicaset.hh"

#include <initializer_list>
#include <vector>

#include <gtest/gtest.h>

#include "mcorch/actor/resources.hh"

using namespace mcorch;
using namespace mcorch::actor;

namespace {

class ReplicasetTest : public ::testing::Test {
 protected:
  ReplicasetTest() : self_(config_.ControllerId(0)), out_(self_) {}

  std::vector<Envelope> Deliver(Msg msg) {
    out_.sent().clear();
    EXPECT_TRUE(ReplicasetController::Handle(
        config_, Envelope{kDatastoreId, self_, kNoOp, msg}, 0, &state_,
        &out_));
    return out_.sent();
  }

  system::ClusterConfig config_;
  ActorId self_;
  Outbox out_;
  ReplicasetControllerState state_;
};

}  // namespace

TEST_F(ReplicasetTest, ScaleFromZero) {
  auto sent = Deliver(Msg::MakeReplicasetChanged(1, 3, 1));
  ASSERT_EQ(3U, sent.size());
  for (std::uint32_t i = 0; i < 3; ++i) {
    ASSERT_EQ(kDatastoreId, sent[i].dst);
    ASSERT_EQ(Msg::MakeCreatePod(MakePodId(1, i), 1, config_.pod_cpu,
                                 config_.pod_mem),
              sent[i].msg);
  }

  // Confirmations of the requested pods change nothing.
  Revision rev = 2;
  for (std::uint32_t i = 0; i < 3; ++i) {
    ASSERT_TRUE(Deliver(Msg::MakePodChanged(1, MakePodId(1, i),
                                            PodPhase::Pending, rev++))
                    .empty());
  }

  for (const auto phase : {PodPhase::Scheduled, PodPhase::Running}) {
    for (std::uint32_t i = 0; i < 3; ++i) {
      ASSERT_TRUE(
          Deliver(Msg::MakePodChanged(1, MakePodId(1, i), phase, rev++))
              .empty());
    }
  }

  const auto& view = state_.replicasets.at(1);
  ASSERT_EQ(3U, view.CurrentScale());
  ASSERT_EQ(3U, view.desired);
}

TEST_F(ReplicasetTest, ReconcileIdempotent) {
  Deliver(Msg::MakeReplicasetChanged(1, 2, 1));
  const auto before = state_;

  ASSERT_TRUE(Deliver(Msg::MakeReplicasetChanged(1, 2, 1)).empty());
  ASSERT_EQ(before, state_);

  // Reconciling a converged snapshot again emits nothing.
  auto view = state_.replicasets.at(1);
  out_.sent().clear();
  ReplicasetController::Reconcile(config_, 1, &view, &out_);
  ASSERT_TRUE(out_.sent().empty());
}

TEST_F(ReplicasetTest, ScaleDownHighestFirst) {
  Deliver(Msg::MakeReplicasetChanged(1, 3, 1));

  auto sent = Deliver(Msg::MakeReplicasetChanged(1, 1, 5));
  ASSERT_EQ(2U, sent.size());
  ASSERT_EQ(Msg::MakeDeletePod(MakePodId(1, 2)), sent[0].msg);
  ASSERT_EQ(Msg::MakeDeletePod(MakePodId(1, 1)), sent[1].msg);

  const auto& view = state_.replicasets.at(1);
  ASSERT_EQ(PodPhase::Terminating, view.pods.at(MakePodId(1, 2)).phase);
  ASSERT_EQ(1U, view.CurrentScale());
}

TEST_F(ReplicasetTest, ReplaceTerminatedWithFreshOrdinal) {
  Deliver(Msg::MakeReplicasetChanged(1, 1, 1));

  auto sent = Deliver(
      Msg::MakePodChanged(1, MakePodId(1, 0), PodPhase::Terminated, 4));
  ASSERT_EQ(1U, sent.size());
  ASSERT_EQ(MakePodId(1, 1), sent[0].msg.pod);

  // An older event for the terminated pod is ignored.
  ASSERT_TRUE(
      Deliver(Msg::MakePodChanged(1, MakePodId(1, 0), PodPhase::Running, 3))
          .empty());
  ASSERT_EQ(PodPhase::Terminated,
            state_.replicasets.at(1).pods.at(MakePodId(1, 0)).phase);
}

TEST_F(ReplicasetTest, PodsBeforeDesiredScale) {
  // Without a known desired scale nothing is reconciled.
  ASSERT_TRUE(
      Deliver(Msg::MakePodChanged(1, MakePodId(1, 0), PodPhase::Running, 2))
          .empty());

  // The existing pod counts towards the scale.
  auto sent = Deliver(Msg::MakeReplicasetChanged(1, 2, 1));
  ASSERT_EQ(1U, sent.size());
  ASSERT_EQ(MakePodId(1, 1), sent[0].msg.pod);
}

/* vim: set ts=2 sts=2 sw=2 et : */
