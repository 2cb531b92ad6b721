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
#include "mcorch/core/types.hh"

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace mcorch::core;

TEST(CoreTypes, RefSharesUntilModified) {
  Ref<std::vector<int>> x(std::vector<int>{1, 2});
  auto y = x;

  ASSERT_TRUE(x.shared());
  ASSERT_EQ(&*x, &*y);

  y.Mut()->push_back(3);

  ASSERT_FALSE(x.shared());
  ASSERT_NE(&*x, &*y);
  ASSERT_EQ(2U, x->size());
  ASSERT_EQ(3U, y->size());
  ASSERT_NE(x, y);
}

TEST(CoreTypes, RefCompareByValue) {
  Ref<std::string> x(std::string("pod"));
  Ref<std::string> y(std::string("pod"));

  ASSERT_EQ(x, y);
  ASSERT_EQ(Ref<std::string>::Hash()(x), Ref<std::string>::Hash()(y));
}

TEST(CoreTypes, RefHashInvalidated) {
  Ref<std::string> x(std::string("a"));
  const auto before = Ref<std::string>::Hash()(x);

  *x.Mut() = "b";
  const auto after = Ref<std::string>::Hash()(x);

  ASSERT_NE(before, after);
  ASSERT_EQ(std::hash<std::string>()("b"), after);
}

TEST(CoreTypes, RelationAcyclic) {
  Relation<int> graph;
  graph.Insert(1, 2);
  graph.Insert(2, 3);
  ASSERT_TRUE(graph.Acyclic());

  graph.Insert(3, 1);
  ASSERT_FALSE(graph.Acyclic());
}

/* vim: set ts=2 sts=2 sw=2 et : */
