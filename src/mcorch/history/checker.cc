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

#include "mcorch/history/checker.hh"

#include <algorithm>
#include <limits>
#include <map>
#include <ostream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <glog/logging.h>

namespace mcorch {
namespace history {

namespace {

constexpr Revision kNoUpperBound = std::numeric_limits<Revision>::max();

bool InRange(const std::string& key, const std::string& start,
             const std::string& end) {
  if (end.empty()) return key == start;
  return start <= key && key < end;
}

/**
 * Replays the effective writes of a history.
 */
class Replay {
 public:
  //! @param writes Effective writes ordered by revision.
  explicit Replay(const std::vector<const Operation*>& writes)
      : writes_(writes) {}

  //! View of [start, end) after all writes at or before at.
  std::vector<actor::KeyValue> ViewAt(const std::string& start,
                                      const std::string& end,
                                      Revision at) const {
    std::map<std::string, std::string> store;

    for (const auto w : writes_) {
      if (w->revision > at) break;

      if (w->kind == OpKind::Put) {
        store[w->key] = w->value;
      } else {
        for (auto it = store.begin(); it != store.end();) {
          if (InRange(it->first, w->key, w->end)) {
            it = store.erase(it);
          } else {
            ++it;
          }
        }
      }
    }

    std::vector<actor::KeyValue> result;
    for (const auto& kv : store) {
      if (InRange(kv.first, start, end)) {
        result.push_back(actor::KeyValue{kv.first, kv.second});
      }
    }
    return result;
  }

  //! Revisions from which on the view may differ: 0 and each write.
  std::vector<Revision> Boundaries() const {
    std::vector<Revision> result{0};
    for (const auto w : writes_) {
      if (w->revision != result.back()) result.push_back(w->revision);
    }
    return result;
  }

 private:
  const std::vector<const Operation*>& writes_;
};

CheckResult Violation(std::string reason, std::vector<OpId> conflict) {
  CheckResult result;
  result.consistent = false;
  result.reason = std::move(reason);
  std::sort(conflict.begin(), conflict.end());
  conflict.erase(std::remove(conflict.begin(), conflict.end(), OpId(0)),
                 conflict.end());
  conflict.erase(std::unique(conflict.begin(), conflict.end()),
                 conflict.end());
  result.conflict = std::move(conflict);
  return result;
}

std::string Describe(const std::vector<actor::KeyValue>& view) {
  std::ostringstream oss;
  oss << "{";
  for (std::size_t i = 0; i < view.size(); ++i) {
    oss << (i != 0 ? ", " : "") << view[i];
  }
  oss << "}";
  return oss.str();
}

}  // namespace

std::ostream& operator<<(std::ostream& os, const CheckResult& result) {
  if (result.consistent) return os << "consistent";

  os << "inconsistent: " << result.reason << " (ops";
  for (const auto op : result.conflict) os << " " << op;
  return os << ")";
}

bool Checker::Precedes(const Operation& a, const Operation& b) const {
  if (!a.completed() || a.finish >= b.start) return false;

  switch (contract_) {
    case Contract::Linearizable:
      return true;
    case Contract::Session:
      return a.session == b.session;
    case Contract::MonotonicSession:
      return a.session == b.session || (a.IsRead() && b.IsRead());
  }

  return true;
}

CheckResult Checker::operator()(const History& history) const {
  std::vector<const Operation*> writes;
  std::vector<const Operation*> reads;

  for (const auto& op : history.operations()) {
    if (op.effective()) {
      writes.push_back(&op);
    } else if (op.IsRead() && op.committed && op.completed()) {
      reads.push_back(&op);
    }
  }

  std::sort(writes.begin(), writes.end(),
            [](const Operation* a, const Operation* b) {
              return a->revision < b->revision;
            });

  for (std::size_t i = 1; i < writes.size(); ++i) {
    if (writes[i - 1]->revision == writes[i]->revision) {
      return Violation("two writes committed at revision " +
                           std::to_string(writes[i]->revision),
                       {writes[i - 1]->id, writes[i]->id});
    }
  }

  for (const auto a : writes) {
    for (const auto b : writes) {
      if (Precedes(*a, *b) && a->revision > b->revision) {
        return Violation("write committed before a write preceding it",
                         {a->id, b->id});
      }
    }
  }

  const Replay replay(writes);

  for (const auto r : reads) {
    if (replay.ViewAt(r->key, r->end, r->revision) != r->result) {
      return Violation("read returned " + Describe(r->result) +
                           " which is not the view at its revision " +
                           std::to_string(r->revision),
                       {r->id});
    }
  }

  std::sort(reads.begin(), reads.end(),
            [](const Operation* a, const Operation* b) {
              return a->finish < b->finish;
            });

  const auto boundaries = replay.Boundaries();
  std::unordered_map<OpId, Revision> placed;

  for (const auto r : reads) {
    Revision lower = 0;
    Revision upper = kNoUpperBound;
    OpId lower_op = 0;
    OpId upper_op = 0;

    for (const auto w : writes) {
      if (Precedes(*w, *r) && w->revision > lower) {
        lower = w->revision;
        lower_op = w->id;
      }

      if (Precedes(*r, *w) && w->revision - 1 < upper) {
        upper = w->revision - 1;
        upper_op = w->id;
      }
    }

    for (const auto prev : reads) {
      auto pos = placed.find(prev->id);
      if (pos == placed.end()) continue;

      if (Precedes(*prev, *r) && pos->second > lower) {
        lower = pos->second;
        lower_op = prev->id;
      }
    }

    bool found = false;
    for (std::size_t i = 0; i < boundaries.size() && !found; ++i) {
      const Revision first = std::max(boundaries[i], lower);
      const Revision last =
          i + 1 < boundaries.size() ? boundaries[i + 1] - 1 : kNoUpperBound;

      if (first > last || first > upper) continue;

      if (replay.ViewAt(r->key, r->end, first) == r->result) {
        placed[r->id] = first;
        found = true;
      }
    }

    if (!found) {
      std::ostringstream oss;
      oss << "read returned " << Describe(r->result)
          << " which is not visible at any revision in [" << lower << ", ";
      if (upper == kNoUpperBound) {
        oss << "latest";
      } else {
        oss << upper;
      }
      oss << "]";
      return Violation(oss.str(), {lower_op, r->id, upper_op});
    }

    VLOG(4) << "placed op" << r->id << " at revision " << placed[r->id];
  }

  return CheckResult();
}

}  // namespace history
}  // namespace mcorch

/* vim: set ts=2 sts=2 sw=2 et : */
