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
#include "mcorch/history/checker.hh"

#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace mcorch;
using namespace mcorch::history;
using actor::KeyValue;
using actor::Msg;

namespace {

class HistoryBuilder {
 public:
  OpId Put(ActorId session, const std::string& key, const std::string& value,
           Revision rev, bool complete = true) {
    const auto op = history_.Invoke(session, Msg::MakePut(key, value));
    history_.Commit(op, Msg::MakeResponse(true, rev));
    if (complete) history_.Complete(op);
    return op;
  }

  OpId Read(ActorId session, const std::string& key, Revision rev,
            std::initializer_list<KeyValue> entries, bool complete = true) {
    const auto op = history_.Invoke(session, Msg::MakeRange(key, ""));
    auto response = Msg::MakeResponse(true, rev);
    response.entries = entries;
    history_.Commit(op, response);
    if (complete) history_.Complete(op);
    return op;
  }

  History& history() { return history_; }

 private:
  History history_;
};

}  // namespace

TEST(HistoryChecker, LinearizableRoundTrip) {
  HistoryBuilder b;
  b.Put(1, "kv/a", "1", 1);
  b.Read(2, "kv/a", 1, {{"kv/a", "1"}});
  b.Read(2, "kv/b", 1, {});

  for (const auto contract : {Contract::Linearizable, Contract::Session,
                              Contract::MonotonicSession}) {
    ASSERT_TRUE(Checker(contract)(b.history()).consistent);
  }
}

TEST(HistoryChecker, StaleReadAfterCompletedWrite) {
  HistoryBuilder b;
  b.Put(1, "kv/a", "1", 1);
  const auto w2 = b.Put(1, "kv/a", "2", 2);
  const auto r = b.Read(2, "kv/a", 1, {{"kv/a", "1"}});

  const auto result = Checker(Contract::Linearizable)(b.history());
  ASSERT_FALSE(result.consistent);
  ASSERT_EQ(std::vector<OpId>({w2, r}), result.conflict);

  std::ostringstream oss;
  oss << result;
  ASSERT_NE(std::string::npos, oss.str().find("inconsistent"));

  // Another session may lag behind.
  ASSERT_TRUE(Checker(Contract::Session)(b.history()).consistent);
  ASSERT_TRUE(Checker(Contract::MonotonicSession)(b.history()).consistent);
}

TEST(HistoryChecker, ConcurrentReadMayBeStale) {
  HistoryBuilder b;
  b.Put(1, "kv/a", "1", 1);

  // The read starts before the second write completes.
  auto& h = b.history();
  const auto w2 = h.Invoke(1, Msg::MakePut("kv/a", "2"));
  const auto r = h.Invoke(2, Msg::MakeRange("kv/a", ""));
  h.Commit(w2, Msg::MakeResponse(true, 2));
  auto response = Msg::MakeResponse(true, 1);
  response.entries = {{"kv/a", "1"}};
  h.Commit(r, response);
  h.Complete(w2);
  h.Complete(r);

  ASSERT_TRUE(Checker(Contract::Linearizable)(h).consistent);
}

TEST(HistoryChecker, ReadYourWrites) {
  HistoryBuilder b;
  b.Put(1, "kv/a", "1", 1);
  b.Put(1, "kv/a", "2", 2);
  b.Read(1, "kv/a", 1, {{"kv/a", "1"}});

  ASSERT_FALSE(Checker(Contract::Session)(b.history()).consistent);
  ASSERT_FALSE(Checker(Contract::MonotonicSession)(b.history()).consistent);
}

TEST(HistoryChecker, SessionMonotonicity) {
  HistoryBuilder b;
  b.Put(1, "kv/a", "1", 1);
  b.Put(1, "kv/a", "2", 2);
  const auto r1 = b.Read(2, "kv/a", 2, {{"kv/a", "2"}});
  const auto r2 = b.Read(3, "kv/a", 1, {{"kv/a", "1"}});

  // Different sessions: only monotonic-session orders their reads.
  ASSERT_TRUE(Checker(Contract::Session)(b.history()).consistent);

  const auto result = Checker(Contract::MonotonicSession)(b.history());
  ASSERT_FALSE(result.consistent);
  ASSERT_EQ(std::vector<OpId>({r1, r2}), result.conflict);

  // Within one session, reads never go back.
  HistoryBuilder same;
  same.Put(1, "kv/a", "1", 1);
  same.Put(1, "kv/a", "2", 2);
  same.Read(2, "kv/a", 2, {{"kv/a", "2"}});
  same.Read(2, "kv/a", 1, {{"kv/a", "1"}});
  ASSERT_FALSE(Checker(Contract::Session)(same.history()).consistent);
}

TEST(HistoryChecker, WritesOrderedByRealTime) {
  HistoryBuilder b;
  const auto w1 = b.Put(1, "kv/a", "1", 2);
  const auto w2 = b.Put(2, "kv/a", "2", 1);

  const auto result = Checker(Contract::Linearizable)(b.history());
  ASSERT_FALSE(result.consistent);
  ASSERT_EQ(std::vector<OpId>({w1, w2}), result.conflict);

  ASSERT_TRUE(Checker(Contract::Session)(b.history()).consistent);
}

TEST(HistoryChecker, DuplicateRevision) {
  HistoryBuilder b;
  b.Put(1, "kv/a", "1", 1);
  b.Put(2, "kv/b", "1", 1);

  ASSERT_FALSE(Checker(Contract::Session)(b.history()).consistent);
}

TEST(HistoryChecker, ResultMustMatchRevision) {
  HistoryBuilder b;
  b.Put(1, "kv/a", "1", 1);
  const auto r = b.Read(2, "kv/a", 1, {{"kv/a", "2"}});

  const auto result = Checker(Contract::Session)(b.history());
  ASSERT_FALSE(result.consistent);
  ASSERT_EQ(std::vector<OpId>({r}), result.conflict);
}

TEST(HistoryChecker, OpenOperationsIgnored) {
  HistoryBuilder b;
  b.Put(1, "kv/a", "1", 1);
  b.Put(1, "kv/a", "2", 2);

  // Never completed: no real-time constraint applies.
  b.Read(1, "kv/a", 1, {{"kv/a", "1"}}, false);
  ASSERT_TRUE(Checker(Contract::Linearizable)(b.history()).consistent);

  // A write that was never answered still counts once committed.
  HistoryBuilder open;
  open.Put(1, "kv/a", "1", 1, false);
  open.Read(2, "kv/a", 1, {{"kv/a", "1"}});
  ASSERT_TRUE(Checker(Contract::Linearizable)(open.history()).consistent);
}

TEST(HistoryChecker, DeleteRange) {
  HistoryBuilder b;
  b.Put(1, "kv/a", "1", 1);

  auto& h = b.history();
  const auto del = h.Invoke(1, Msg::MakeDeleteRange("kv/a", ""));
  auto response = Msg::MakeResponse(true, 2);
  response.count = 1;
  h.Commit(del, response);
  h.Complete(del);

  b.Read(2, "kv/a", 2, {});
  ASSERT_TRUE(Checker(Contract::Linearizable)(h).consistent);

  b.Read(2, "kv/a", 1, {{"kv/a", "1"}});
  ASSERT_FALSE(Checker(Contract::Linearizable)(h).consistent);
}

/* vim: set ts=2 sts=2 sw=2 et : */
