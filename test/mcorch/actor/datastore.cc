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
#include "mcorch/actor/datastore.hh"

#include <initializer_list>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "mcorch/core/ts.hh"

using namespace mcorch;
using namespace mcorch::actor;
using history::Contract;

namespace {

std::vector<KeyValue> Entries(std::initializer_list<KeyValue> kvs) {
  return kvs;
}

}  // namespace

TEST(Datastore, MultiVersionReads) {
  DatastoreState ds;
  ASSERT_EQ(1U, ds.Put("kv/a", "1"));
  ASSERT_EQ(2U, ds.Put("kv/a", "2"));
  ASSERT_EQ(3U, ds.Put("kv/b", "x"));

  ASSERT_EQ("2", *ds.Get("kv/a"));
  ASSERT_EQ(Entries({{"kv/a", "1"}}), ds.RangeAt("kv/a", "", 1));
  ASSERT_EQ(Entries({{"kv/a", "2"}, {"kv/b", "x"}}),
            ds.RangeAt("kv/", PrefixEnd("kv/"), 3));
  ASSERT_TRUE(ds.RangeAt("kv/", PrefixEnd("kv/"), 0).empty());

  ASSERT_EQ(2U, ds.DeleteRange("kv/", PrefixEnd("kv/")));
  ASSERT_EQ(4U, ds.revision);
  ASSERT_EQ(nullptr, ds.Get("kv/a"));
  ASSERT_EQ(Entries({{"kv/a", "2"}}), ds.RangeAt("kv/a", "", 3));

  // Nothing left to delete: no revision is committed.
  ASSERT_EQ(0U, ds.DeleteRange("kv/", PrefixEnd("kv/")));
  ASSERT_EQ(4U, ds.revision);
}

TEST(Datastore, ReadableRevisionsPerContract) {
  DatastoreState ds;
  ds.Put("kv/a", "1");
  ds.Put("kv/a", "2");

  ASSERT_EQ(std::vector<Revision>({2}),
            ds.ReadableRevisions(Contract::Linearizable, 9, "kv/a", "", 2));
  ASSERT_EQ(std::vector<Revision>({2, 1, 0}),
            ds.ReadableRevisions(Contract::Session, 9, "kv/a", "", 2));
  ASSERT_EQ(std::vector<Revision>({2, 1}),
            ds.ReadableRevisions(Contract::Session, 9, "kv/a", "", 1));

  // Another session's read raises the floor only across sessions.
  ds.Observe(8, 1, true);
  ASSERT_EQ(std::vector<Revision>({2, 1, 0}),
            ds.ReadableRevisions(Contract::Session, 9, "kv/a", "", 2));
  ASSERT_EQ(std::vector<Revision>({2, 1}),
            ds.ReadableRevisions(Contract::MonotonicSession, 9, "kv/a", "",
                                 2));

  // A session never reads behind what it has written.
  ds.Observe(9, 2, false);
  ASSERT_EQ(std::vector<Revision>({2}),
            ds.ReadableRevisions(Contract::Session, 9, "kv/a", "", 2));
  ASSERT_EQ(2U, ds.SessionFloor(9));
  ASSERT_EQ(1U, ds.read_floor);
}

namespace {

class DatastoreTest : public ::testing::Test {
 protected:
  DatastoreTest() : out_(kDatastoreId) {
    config_.nodes = 2;
    state_ = Datastore::Init(config_, kDatastoreId, &out_);
  }

  std::vector<Envelope> Deliver(ActorId src, Msg msg, std::size_t choice = 0,
                                OpId op = kNoOp) {
    out_.sent().clear();
    EXPECT_TRUE(Datastore::Handle(config_,
                                  Envelope{src, kDatastoreId, op, msg}, choice,
                                  &state_, &out_));
    return out_.sent();
  }

  PodRecord Pod(PodId id) const {
    PodRecord pod;
    EXPECT_TRUE(state_.GetPod(id, &pod));
    return pod;
  }

  system::ClusterConfig config_;
  Outbox out_;
  DatastoreState state_;
};

}  // namespace

TEST_F(DatastoreTest, PodLifecycle) {
  const ActorId scheduler = config_.SchedulerId(0);
  const ActorId controller = config_.ControllerId(0);
  const PodId id = MakePodId(1, 0);

  auto sent = Deliver(controller, Msg::MakeCreatePod(id, 1, 2, 2));
  ASSERT_EQ(2U, sent.size());
  ASSERT_EQ(controller, sent[0].dst);
  ASSERT_EQ(Msg::MakePodChanged(1, id, PodPhase::Pending, 1), sent[0].msg);
  ASSERT_EQ(scheduler, sent[1].dst);
  ASSERT_EQ(Msg::MakeSchedulePod(id, 2, 2), sent[1].msg);

  // Creating again has no effect.
  ASSERT_TRUE(Deliver(controller, Msg::MakeCreatePod(id, 1, 2, 2)).empty());

  sent = Deliver(scheduler, Msg::MakeBindPod(id, 2));
  ASSERT_EQ(2U, sent.size());
  ASSERT_EQ(PodPhase::Scheduled, Pod(id).phase);
  ASSERT_EQ(2U, Pod(id).node);
  ASSERT_EQ(kKubeletId, sent[1].dst);
  ASSERT_EQ(Msg::MakeStartPod(id, 2), sent[1].msg);

  // A repeated binding is ignored, a conflicting one refused.
  ASSERT_TRUE(Deliver(scheduler, Msg::MakeBindPod(id, 2)).empty());
  sent = Deliver(scheduler, Msg::MakeBindPod(id, 1));
  ASSERT_EQ(1U, sent.size());
  ASSERT_EQ(scheduler, sent[0].dst);
  ASSERT_FALSE(sent[0].msg.ok);
  ASSERT_EQ(id, sent[0].msg.pod);
  ASSERT_EQ(2U, Pod(id).node);

  Deliver(kKubeletId, Msg::MakePodRunning(id));
  ASSERT_EQ(PodPhase::Running, Pod(id).phase);

  sent = Deliver(controller, Msg::MakeDeletePod(id));
  ASSERT_EQ(PodPhase::Terminating, Pod(id).phase);
  ASSERT_EQ(2U, sent.size());
  ASSERT_EQ(Msg::MakeStopPod(id, 2), sent[1].msg);

  sent = Deliver(kKubeletId, Msg::MakePodStopped(id));
  PodRecord gone;
  ASSERT_FALSE(state_.GetPod(id, &gone));
  ASSERT_EQ(2U, sent.size());
  ASSERT_EQ(PodPhase::Terminated, sent[0].msg.phase);
  ASSERT_EQ(Msg::MakeReleasePod(id), sent[1].msg);
}

TEST_F(DatastoreTest, DeletePendingPod) {
  const PodId id = MakePodId(0, 1);
  Deliver(config_.ClientId(0), Msg::MakeCreatePod(id, 0, 2, 2));

  // Standalone pods are not announced to controllers.
  ASSERT_TRUE(Deliver(config_.ClientId(0), Msg::MakeDeletePod(id)).empty());

  PodRecord gone;
  ASSERT_FALSE(state_.GetPod(id, &gone));

  // Binding a deleted pod is refused.
  auto sent = Deliver(config_.SchedulerId(0), Msg::MakeBindPod(id, 1));
  ASSERT_EQ(1U, sent.size());
  ASSERT_FALSE(sent[0].msg.ok);
}

TEST_F(DatastoreTest, ScaleReplicaset) {
  auto sent = Deliver(config_.ClientId(0), Msg::MakeCreateReplicaset(5, 2));
  ASSERT_EQ(1U, sent.size());
  ASSERT_EQ(Msg::MakeReplicasetChanged(5, 2, 1), sent[0].msg);

  // Same scale: nothing to announce.
  ASSERT_TRUE(
      Deliver(config_.ClientId(0), Msg::MakeScaleReplicaset(5, 2)).empty());

  sent = Deliver(config_.ClientId(0), Msg::MakeScaleReplicaset(5, 3));
  ASSERT_EQ(1U, sent.size());
  ASSERT_EQ(Msg::MakeReplicasetChanged(5, 3, 2), sent[0].msg);
  ASSERT_EQ(3U, state_.Replicasets().at(0).replicas);
}

TEST_F(DatastoreTest, RangeServedFromChoice) {
  config_.datastore_reads = Contract::Session;
  const ActorId writer = config_.ClientId(0);

  Deliver(writer, Msg::MakePut("kv/a", "1"), 0, 1);
  Deliver(writer, Msg::MakePut("kv/a", "2"), 0, 2);

  // Another session may read either view.
  const ActorId reader = writer + 1;
  auto sent = Deliver(reader, Msg::MakeRange("kv/a", ""), 1, 3);
  ASSERT_EQ(1U, sent.size());
  ASSERT_EQ(3U, sent[0].op);
  ASSERT_EQ(1U, sent[0].msg.revision);
  ASSERT_EQ(Entries({{"kv/a", "1"}}), sent[0].msg.entries);

  // Having observed revision 1, revision 0 is no longer readable.
  out_.sent().clear();
  ASSERT_FALSE(Datastore::Handle(
      config_, Envelope{reader, kDatastoreId, 4, Msg::MakeRange("kv/a", "")},
      2, &state_, &out_));

  // The writer only reads its own writes.
  ASSERT_FALSE(Datastore::Handle(
      config_, Envelope{writer, kDatastoreId, 5, Msg::MakeRange("kv/a", "")},
      1, &state_, &out_));
}

TEST_F(DatastoreTest, CreateOnlyPut) {
  Deliver(config_.ClientId(0), Msg::MakePut("kv/a", "1"), 0, 1);
  auto sent =
      Deliver(config_.ClientId(0), Msg::MakePut("kv/a", "2", true), 0, 2);
  ASSERT_EQ(1U, sent.size());
  ASSERT_FALSE(sent[0].msg.ok);
  ASSERT_EQ("1", *state_.Get("kv/a"));
}

TEST_F(DatastoreTest, BindToUnknownNode) {
  ASSERT_THROW(Datastore::Handle(config_,
                                 Envelope{config_.SchedulerId(0), kDatastoreId,
                                          kNoOp, Msg::MakeBindPod(1, 3)},
                                 0, &state_, &out_),
               core::Error);
}

/* vim: set ts=2 sts=2 sw=2 et : */
