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

#include "mcorch/history/history.hh"

#include <ostream>
#include <string>
#include <utility>

#include <gsl/gsl>

namespace mcorch {
namespace history {

std::size_t Operation::Hash::operator()(const Operation& k) const {
  std::size_t h = k.id;
  CombineHash(k.session, &h);
  CombineHash(k.kind, &h);
  CombineHash(k.key, &h);
  CombineHash(k.end, &h);
  CombineHash(k.value, &h);
  CombineHash(k.start, &h);
  CombineHash(k.finish, &h);
  CombineHash(k.committed, &h);
  CombineHash(k.ok, &h);
  CombineHash(k.revision, &h);
  CombineHash(k.count, &h);
  CombineHashRange(k.result.begin(), k.result.end(), &h);
  return h;
}

bool Operation::operator==(const Operation& rhs) const {
  return id == rhs.id && session == rhs.session && kind == rhs.kind &&
         key == rhs.key && end == rhs.end && value == rhs.value &&
         start == rhs.start && finish == rhs.finish &&
         committed == rhs.committed && ok == rhs.ok &&
         revision == rhs.revision && count == rhs.count &&
         result == rhs.result;
}

std::ostream& operator<<(std::ostream& os, const Operation& op) {
  os << "op" << op.id << " session " << op.session << ": " << op.kind << "("
     << op.key;
  if (op.kind == OpKind::Put) {
    os << ", " << op.value;
  } else if (!op.end.empty()) {
    os << ", " << op.end;
  }
  os << ") [" << op.start << ", ";
  if (op.completed()) {
    os << op.finish;
  } else {
    os << "open";
  }
  os << "]";

  if (!op.committed) return os << " not committed";

  os << " @" << op.revision;
  if (op.kind == OpKind::DeleteRange) os << " deleted " << op.count;
  if (op.IsRead()) {
    os << " ->";
    if (op.result.empty()) os << " (empty)";
    for (const auto& kv : op.result) os << " " << kv;
  }

  return os;
}

std::size_t History::Hash::operator()(const History& k) const {
  std::size_t h = k.clock_;
  CombineHashRange(k.operations_.begin(), k.operations_.end(), &h);
  return h;
}

OpId History::Invoke(ActorId session, const actor::Msg& request) {
  Expects(request.IsKvRequest());

  Operation op;
  op.id = operations_.size() + 1;
  op.session = session;
  switch (request.type) {
    case actor::Msg::Type::Put:
      op.kind = OpKind::Put;
      break;
    case actor::Msg::Type::DeleteRange:
      op.kind = OpKind::DeleteRange;
      break;
    default:
      op.kind = OpKind::Range;
      break;
  }
  op.key = request.key;
  op.end = request.end;
  op.value = request.value;
  op.start = ++clock_;

  operations_.push_back(std::move(op));
  return operations_.back().id;
}

void History::Commit(OpId op, const actor::Msg& response) {
  auto& o = mutable_at(op);
  Expects(!o.committed);

  o.committed = true;
  o.ok = response.ok;
  o.revision = response.revision;
  o.count = response.count;
  o.result = response.entries;
}

void History::Complete(OpId op) {
  auto& o = mutable_at(op);
  if (o.completed()) return;
  o.finish = ++clock_;
}

const Operation& History::at(OpId op) const {
  Expects(op != 0 && op <= operations_.size());
  return operations_[op - 1];
}

Operation& History::mutable_at(OpId op) {
  Expects(op != 0 && op <= operations_.size());
  return operations_[op - 1];
}

std::ostream& operator<<(std::ostream& os, const History& history) {
  for (const auto& op : history.operations()) {
    os << " |   " << op << std::endl;
  }
  return os;
}

}  // namespace history
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
