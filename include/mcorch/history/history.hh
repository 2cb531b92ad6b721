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

#ifndef MCORCH_HISTORY_HISTORY_HH_
#define MCORCH_HISTORY_HISTORY_HH_

#include <cstddef>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <vector>

#include "mcorch/actor/types.hh"

namespace mcorch {
namespace history {

using actor::ActorId;
using actor::OpId;
using actor::Revision;

PRINTABLE_ENUM_CLASS(OpKind, inline, Range, Put, DeleteRange);

//! Finish time of an operation whose response has not been received.
constexpr std::uint64_t kOpen = std::numeric_limits<std::uint64_t>::max();

/**
 * A key-value operation as recorded from the messages of one path. Times are
 * logical: the history's event counter at invocation and completion.
 */
struct Operation {
  struct Hash {
    std::size_t operator()(const Operation& k) const;
  };

  bool operator==(const Operation& rhs) const;

  //! Committed a new revision.
  bool effective() const {
    return committed && ok &&
           (kind == OpKind::Put || (kind == OpKind::DeleteRange && count != 0));
  }

  bool completed() const { return finish != kOpen; }

  bool IsRead() const { return kind == OpKind::Range; }

  OpId id = 0;
  ActorId session = 0;
  OpKind kind = OpKind::Range;
  std::string key;
  std::string end;
  std::string value;
  std::uint64_t start = 0;
  std::uint64_t finish = kOpen;

  //! The datastore has processed the request.
  bool committed = false;
  bool ok = false;

  //! Revision the write committed at, or the read was served from.
  Revision revision = 0;

  //! Keys deleted by DeleteRange.
  std::uint32_t count = 0;

  //! Entries returned by Range.
  std::vector<actor::KeyValue> result;
};

std::ostream& operator<<(std::ostream& os, const Operation& op);

/**
 * History of the key-value operations on one path.
 */
class History {
 public:
  struct Hash {
    std::size_t operator()(const History& k) const;
  };

  /**
   * Records a request being sent.
   *
   * @pre request.IsKvRequest()
   * @return Id of the new operation.
   */
  OpId Invoke(ActorId session, const actor::Msg& request);

  //! Records the datastore's response to op being sent.
  void Commit(OpId op, const actor::Msg& response);

  //! Records the response to op being received; no-op if already received.
  void Complete(OpId op);

  const Operation& at(OpId op) const;

  const std::vector<Operation>& operations() const { return operations_; }

  bool empty() const { return operations_.empty(); }

  bool operator==(const History& rhs) const {
    return clock_ == rhs.clock_ && operations_ == rhs.operations_;
  }

 private:
  Operation& mutable_at(OpId op);

  std::uint64_t clock_ = 0;
  std::vector<Operation> operations_;
};

std::ostream& operator<<(std::ostream& os, const History& history);

}  // namespace history
}  // namespace mcorch

#endif /* MCORCH_HISTORY_HISTORY_HH_ */

/* vim: set ts=2 sts=2 sw=2 et : */
