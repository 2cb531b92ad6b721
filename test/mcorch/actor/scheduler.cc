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
#include "mcorch/actor/scheduler.hh"

#include <gtest/gtest.h>

#include "mcorch/core/ts.hh"

using namespace mcorch;
using namespace mcorch::actor;

namespace {

class SchedulerTest : public ::testing::Test {
 protected:
  SchedulerTest() : out_(2) {
    config_.nodes = 1;
    state_ = Scheduler::Init(config_, 2, &out_);
  }

  //! @return The message sent in response to msg, if exactly one.
  const Envelope* Deliver(Msg msg) {
    out_.sent().clear();
    const Envelope env{kDatastoreId, 2, kNoOp, msg};
    EXPECT_TRUE(Scheduler::Handle(config_, env, 0, &state_, &out_));
    return out_.sent().size() == 1 ? &out_.sent().front() : nullptr;
  }

  system::ClusterConfig config_;
  Outbox out_;
  SchedulerState state_;
};

}  // namespace

TEST_F(SchedulerTest, FirstFitUntilFull) {
  auto bind = Deliver(Msg::MakeSchedulePod(101, 2, 2));
  ASSERT_NE(nullptr, bind);
  ASSERT_EQ(kDatastoreId, bind->dst);
  ASSERT_EQ(Msg::MakeBindPod(101, 1), bind->msg);

  bind = Deliver(Msg::MakeSchedulePod(102, 2, 2));
  ASSERT_NE(nullptr, bind);
  ASSERT_EQ(Msg::MakeBindPod(102, 1), bind->msg);

  const Node* node = state_.FindNode(1);
  ASSERT_NE(nullptr, node);
  ASSERT_EQ(4U, node->allocated.cpu);
  ASSERT_EQ(4U, node->allocated.mem);
  ASSERT_EQ(2U, node->allocated.pods);

  // No room left: the pod waits.
  ASSERT_EQ(nullptr, Deliver(Msg::MakeSchedulePod(103, 2, 2)));
  ASSERT_TRUE(out_.sent().empty());
  ASSERT_EQ(0U, state_.bindings.count(103));
  ASSERT_EQ(1U, state_.waiting.count(103));

  // Once a pod is gone, the waiting pod takes its place.
  bind = Deliver(Msg::MakeReleasePod(101));
  ASSERT_NE(nullptr, bind);
  ASSERT_EQ(Msg::MakeBindPod(103, 1), bind->msg);
  ASSERT_TRUE(state_.waiting.empty());

  // A repeated request repeats the decision.
  bind = Deliver(Msg::MakeSchedulePod(103, 2, 2));
  ASSERT_NE(nullptr, bind);
  ASSERT_EQ(Msg::MakeBindPod(103, 1), bind->msg);
}

TEST_F(SchedulerTest, LowestNodeIdFirst) {
  config_.nodes = 3;
  state_ = Scheduler::Init(config_, 2, &out_);

  auto bind = Deliver(Msg::MakeSchedulePod(7, 4, 2));
  ASSERT_NE(nullptr, bind);
  ASSERT_EQ(1U, bind->msg.node);

  bind = Deliver(Msg::MakeSchedulePod(8, 1, 1));
  ASSERT_NE(nullptr, bind);
  ASSERT_EQ(2U, bind->msg.node);
}

TEST_F(SchedulerTest, RepeatedRequestIsIdempotent) {
  const auto first = *Deliver(Msg::MakeSchedulePod(101, 2, 2));
  const auto before = state_;

  const auto second = Deliver(Msg::MakeSchedulePod(101, 2, 2));
  ASSERT_NE(nullptr, second);
  ASSERT_EQ(first.msg, second->msg);
  ASSERT_EQ(before, state_);
}

TEST_F(SchedulerTest, RejectedBindingReleased) {
  Deliver(Msg::MakeSchedulePod(101, 2, 2));

  Msg reject = Msg::MakeResponse(false, 0);
  reject.pod = 101;
  ASSERT_EQ(nullptr, Deliver(reject));

  ASSERT_TRUE(state_.bindings.empty());
  ASSERT_EQ(0U, state_.FindNode(1)->allocated.pods);
}

TEST_F(SchedulerTest, RejectedBindingPlacesWaitingPod) {
  Deliver(Msg::MakeSchedulePod(101, 2, 2));
  Deliver(Msg::MakeSchedulePod(102, 2, 2));
  ASSERT_EQ(nullptr, Deliver(Msg::MakeSchedulePod(103, 2, 2)));

  // 101 was deleted before its binding arrived.
  Msg reject = Msg::MakeResponse(false, 0);
  reject.pod = 101;
  const auto bind = Deliver(reject);
  ASSERT_NE(nullptr, bind);
  ASSERT_EQ(Msg::MakeBindPod(103, 1), bind->msg);

  ASSERT_EQ(0U, state_.bindings.count(101));
  ASSERT_EQ(1U, state_.bindings.count(103));
  ASSERT_TRUE(state_.waiting.empty());
  ASSERT_EQ(2U, state_.FindNode(1)->allocated.pods);
}

TEST_F(SchedulerTest, WaitingPodsLowestIdFirst) {
  Deliver(Msg::MakeSchedulePod(101, 2, 2));
  Deliver(Msg::MakeSchedulePod(102, 2, 2));
  Deliver(Msg::MakeSchedulePod(105, 2, 2));
  Deliver(Msg::MakeSchedulePod(104, 2, 2));
  ASSERT_EQ(2U, state_.waiting.size());

  const auto bind = Deliver(Msg::MakeReleasePod(102));
  ASSERT_NE(nullptr, bind);
  ASSERT_EQ(Msg::MakeBindPod(104, 1), bind->msg);
  ASSERT_EQ(1U, state_.waiting.count(105));
}

TEST_F(SchedulerTest, ReleasedWaitingPodForgotten) {
  Deliver(Msg::MakeSchedulePod(101, 2, 2));
  Deliver(Msg::MakeSchedulePod(102, 2, 2));
  Deliver(Msg::MakeSchedulePod(103, 2, 2));

  // 103 was deleted while pending.
  ASSERT_EQ(nullptr, Deliver(Msg::MakeReleasePod(103)));
  ASSERT_TRUE(state_.waiting.empty());

  ASSERT_EQ(nullptr, Deliver(Msg::MakeReleasePod(101)));
  ASSERT_TRUE(out_.sent().empty());
  ASSERT_EQ(1U, state_.FindNode(1)->allocated.pods);
}

TEST_F(SchedulerTest, UnexpectedMessage) {
  const Envelope env{kDatastoreId, 2, kNoOp, Msg::MakePodRunning(1)};
  ASSERT_THROW(Scheduler::Handle(config_, env, 0, &state_, &out_),
               core::Error);
  ASSERT_FALSE(Scheduler::Handle(
      config_, Envelope{kDatastoreId, 2, kNoOp, Msg::MakeReleasePod(1)}, 1,
      &state_, &out_));
}

/* vim: set ts=2 sts=2 sw=2 et : */
