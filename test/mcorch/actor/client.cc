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
#include "mcorch/actor/client.hh"

#include <gtest/gtest.h>

#include "mcorch/actor/resources.hh"

using namespace mcorch;
using namespace mcorch::actor;

namespace {

class ClientTest : public ::testing::Test {
 protected:
  ClientTest() : out_(config_.ClientId(0)) {
    config_.client_budget.create_pods = 2;
    config_.client_budget.delete_pods = 1;
    config_.client_budget.kv_puts = 2;
    config_.client_budget.kv_ranges = 1;
    state_ = Client::Init(config_, config_.ClientId(0), &out_);
  }

  const Msg& Act(ClientAction action, std::size_t arg = 0) {
    out_.sent().clear();
    Client::Act(config_, action, arg, &state_, &out_);
    EXPECT_EQ(1U, out_.sent().size());
    return out_.sent().front().msg;
  }

  system::ClusterConfig config_;
  Outbox out_;
  ClientState state_;
};

}  // namespace

TEST_F(ClientTest, BudgetLimitsActions) {
  ASSERT_FALSE(Client::Enabled(config_, state_, ClientAction::ScaleUp, 0));
  ASSERT_FALSE(
      Client::Enabled(config_, state_, ClientAction::CreateDeployment, 0));

  ASSERT_EQ(MakePodId(0, 1), Act(ClientAction::CreatePod).pod);
  ASSERT_EQ(MakePodId(0, 2), Act(ClientAction::CreatePod).pod);
  ASSERT_FALSE(Client::Enabled(config_, state_, ClientAction::CreatePod, 0));

  // Standalone pods are deleted latest first.
  const auto& del = Act(ClientAction::DeletePod);
  ASSERT_EQ(Msg::Type::DeletePod, del.type);
  ASSERT_EQ(MakePodId(0, 2), del.pod);
  ASSERT_FALSE(Client::Enabled(config_, state_, ClientAction::DeletePod, 0));
}

TEST_F(ClientTest, OneKeyValueRequestOutstanding) {
  const auto& put = Act(ClientAction::Put, 1);
  ASSERT_EQ(Msg::MakePut("kv/b", "c0-1"), put);

  ASSERT_FALSE(Client::Enabled(config_, state_, ClientAction::Put, 0));
  ASSERT_FALSE(Client::Enabled(config_, state_, ClientAction::Range, 0));

  ASSERT_TRUE(Client::Handle(
      config_,
      Envelope{kDatastoreId, config_.ClientId(0), 1,
               Msg::MakeResponse(true, 1)},
      0, &state_, &out_));
  ASSERT_TRUE(Client::Enabled(config_, state_, ClientAction::Put, 0));
  ASSERT_FALSE(Client::Enabled(config_, state_, ClientAction::Put, 2));

  const auto& range = Act(ClientAction::Range);
  ASSERT_EQ(Msg::MakeRange("kv/", PrefixEnd("kv/")), range);
}

TEST_F(ClientTest, ScaleDeployment) {
  config_.client_budget.create_deployments = 1;
  config_.client_budget.scale_ups = 1;
  config_.client_budget.scale_downs = 2;
  config_.deployment_replicas = 1;
  state_ = Client::Init(config_, config_.ClientId(0), &out_);

  ASSERT_EQ(Msg::MakeCreateReplicaset(1000, 1),
            Act(ClientAction::CreateDeployment));
  ASSERT_EQ(Msg::MakeScaleReplicaset(1000, 2), Act(ClientAction::ScaleUp));
  ASSERT_EQ(Msg::MakeScaleReplicaset(1000, 1), Act(ClientAction::ScaleDown));
  ASSERT_EQ(Msg::MakeScaleReplicaset(1000, 0), Act(ClientAction::ScaleDown));
}

/* vim: set ts=2 sts=2 sw=2 et : */
