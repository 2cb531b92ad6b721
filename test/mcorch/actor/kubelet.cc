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
#include "mcorch/actor/kubelet.hh"

#include <utility>

#include <gtest/gtest.h>

#include "mcorch/core/ts.hh"

using namespace mcorch;
using namespace mcorch::actor;

namespace {

Envelope FromDatastore(Msg msg) {
  return Envelope{kDatastoreId, kKubeletId, kNoOp, std::move(msg)};
}

}  // namespace

TEST(Kubelet, AcknowledgesStartAndStop) {
  system::ClusterConfig config;
  Outbox out(kKubeletId);
  auto state = Kubelet::Init(config, kKubeletId, &out);
  ASSERT_TRUE(out.sent().empty());

  ASSERT_TRUE(Kubelet::Handle(config, FromDatastore(Msg::MakeStartPod(7, 1)),
                              0, &state, &out));
  ASSERT_EQ(1U, state.running.count(7));
  ASSERT_EQ(1U, out.sent().size());
  ASSERT_EQ(kDatastoreId, out.sent()[0].dst);
  ASSERT_EQ(Msg::MakePodRunning(7), out.sent()[0].msg);

  ASSERT_TRUE(Kubelet::Handle(config, FromDatastore(Msg::MakeStopPod(7, 1)),
                              0, &state, &out));
  ASSERT_TRUE(state.running.empty());
  ASSERT_EQ(Msg::MakePodStopped(7), out.sent()[1].msg);
}

TEST(Kubelet, SingleChoice) {
  system::ClusterConfig config;
  Outbox out(kKubeletId);
  KubeletState state;

  ASSERT_FALSE(Kubelet::Handle(config, FromDatastore(Msg::MakeStartPod(7, 1)),
                               1, &state, &out));
  ASSERT_THROW(Kubelet::Handle(config, FromDatastore(Msg::MakeBindPod(7, 1)),
                               0, &state, &out),
               core::Error);
}

/* vim: set ts=2 sts=2 sw=2 et : */
