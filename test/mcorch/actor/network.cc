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
#include "mcorch/actor/network.hh"

#include <sstream>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "mcorch/core/ts.hh"

using namespace mcorch;
using namespace mcorch::actor;

namespace {

system::FaultBudget Budget(std::uint32_t drops, std::uint32_t duplicates,
                           std::uint32_t partitions) {
  system::FaultBudget budget;
  budget.drops = drops;
  budget.duplicates = duplicates;
  budget.partitions = partitions;
  return budget;
}

Envelope Env(ActorId src, ActorId dst, Msg msg, OpId op = kNoOp) {
  return Envelope{src, dst, op, std::move(msg)};
}

}  // namespace

TEST(Network, InFlightIsCanonical) {
  Network a(4, Budget(0, 0, 0));
  Network b(4, Budget(0, 0, 0));

  a.Send(Env(0, 2, Msg::MakeSchedulePod(1, 2, 2)));
  a.Send(Env(2, 0, Msg::MakeBindPod(1, 1)));
  b.Send(Env(2, 0, Msg::MakeBindPod(1, 1)));
  b.Send(Env(0, 2, Msg::MakeSchedulePod(1, 2, 2)));

  ASSERT_EQ(a, b);
  ASSERT_EQ(Network::Hash()(a), Network::Hash()(b));

  const auto env = a.Take(0);
  ASSERT_EQ(0U, env.src);
  ASSERT_EQ(1U, a.in_flight().size());
}

TEST(Network, CapacityBound) {
  Network net(1, Budget(0, 1, 0));
  net.Send(Env(0, 1, Msg::MakeStartPod(1, 1)));

  ASSERT_THROW(net.Send(Env(0, 1, Msg::MakeStartPod(2, 1))),
               core::BoundExceeded);
  ASSERT_TRUE(net.CanDuplicate(0));
  ASSERT_THROW(net.Duplicate(0), core::BoundExceeded);
}

TEST(Network, DropAndDuplicateBudget) {
  Network net(4, Budget(1, 1, 0));
  net.Send(Env(0, 1, Msg::MakeStartPod(1, 1)));
  net.Send(Env(4, 0, Msg::MakePut("kv/a", "1"), 1));

  // Recorded operations are never duplicated.
  ASSERT_TRUE(net.CanDuplicate(0));
  ASSERT_FALSE(net.CanDuplicate(1));

  net.Duplicate(0);
  ASSERT_EQ(3U, net.in_flight().size());
  ASSERT_FALSE(net.CanDuplicate(0));

  ASSERT_TRUE(net.CanDrop(2));
  net.Drop(2);
  ASSERT_EQ(2U, net.in_flight().size());
  ASSERT_FALSE(net.CanDrop(0));
}

TEST(Network, Partition) {
  Network net(4, Budget(0, 0, 1));
  const std::uint64_t group = 1ULL << 2;  // actor 2 alone
  net.Send(Env(0, 2, Msg::MakeSchedulePod(1, 2, 2)));
  net.Send(Env(0, 1, Msg::MakeStartPod(1, 1)));

  ASSERT_TRUE(net.CanPartition(group));
  net.Partition(group);

  ASSERT_TRUE(net.IsPartitioned(group));
  ASSERT_FALSE(net.CanPartition(group));
  ASSERT_TRUE(net.Separated(0, 2));
  ASSERT_FALSE(net.Separated(0, 1));
  ASSERT_EQ(1U, net.in_flight()[0].dst);
  ASSERT_TRUE(net.Deliverable(0));
  ASSERT_FALSE(net.Deliverable(1));

  std::ostringstream oss;
  oss << net;
  ASSERT_NE(std::string::npos, oss.str().find("(blocked)"));

  ASSERT_TRUE(net.Heal(group));
  ASSERT_FALSE(net.Heal(group));
  ASSERT_TRUE(net.Deliverable(1));

  // The budget is spent.
  ASSERT_FALSE(net.CanPartition(group));
}

/* vim: set ts=2 sts=2 sw=2 et : */
