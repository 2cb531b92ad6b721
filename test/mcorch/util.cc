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
#include "mcorch/util.hh"

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace mcorch;

PRINTABLE_ENUM_CLASS(TestEnum, inline, kFirst, kSecond, kThird);

TEST(Util, PrintableEnumClass) {
  std::ostringstream oss;
  oss << TestEnum::kFirst << TestEnum::kSecond << TestEnum::kThird;
  ASSERT_EQ(oss.str(), "kFirstkSecondkThird");
}

TEST(Util, EnumNames) {
  const auto names = detail::EnumNames("A,  B, C_d");
  ASSERT_EQ((std::vector<std::string>{"A", "B", "C_d"}), names);
}

TEST(Util, CombineHashOrderSensitive) {
  std::size_t a = 0;
  CombineHash(std::string("x"), &a);
  CombineHash(1, &a);

  std::size_t b = 0;
  CombineHash(1, &b);
  CombineHash(std::string("x"), &b);

  ASSERT_NE(a, b);

  const std::vector<int> v{1, 2};
  std::size_t c = 0;
  CombineHashRange(v.begin(), v.end(), &c);

  std::size_t d = 0;
  CombineHash(1, &d);
  CombineHash(2, &d);
  ASSERT_EQ(c, d);
}

/* vim: set ts=2 sts=2 sw=2 et : */
