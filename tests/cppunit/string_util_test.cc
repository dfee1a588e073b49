/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 *
 */

#include "string_util.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <map>
#include <string>
#include <vector>

TEST(StringUtil, ToLower) {
  std::map<std::string, std::string> cases{
      {"9Q8YY", "9q8yy"},
      {"Mi", "mi"},
      {"km", "km"},
  };
  for (const auto &iter : cases) {
    ASSERT_EQ(util::ToLower(iter.first), iter.second);
  }
}

TEST(StringUtil, EqualICase) {
  ASSERT_TRUE(util::EqualICase("stdout", "STDOUT"));
  ASSERT_TRUE(util::EqualICase("", ""));
  ASSERT_FALSE(util::EqualICase("stdout", "stdout2"));
  ASSERT_FALSE(util::EqualICase("mi", "km"));
}

TEST(StringUtil, Trim) {
  std::map<std::string, std::string> cases{
      {"abc", "abc"},         {"   abc    ", "abc"}, {"\t\tabc\t\t", "abc"}, {"\t\tabc\n\n", "abc"},
      {"\n\nabc\n\n", "abc"}, {" a b", "a b"},       {"a \tb\t \n", "a \tb"}, {"  \t ", ""},
  };
  for (const auto &iter : cases) {
    ASSERT_EQ(util::Trim(iter.first, " \t\n"), iter.second);
  }
}

TEST(StringUtil, Split) {
  std::vector<std::string> expected = {"p1", "37.78", "-122.42", "1700000000"};
  ASSERT_EQ(util::Split("p1 37.78 -122.42 1700000000", " "), expected);
  ASSERT_EQ(util::Split("p1\t37.78  -122.42\t 1700000000 ", " \t"), expected);
  ASSERT_EQ(util::Split(",p1,,37.78,-122.42,1700000000,", ","), expected);

  ASSERT_EQ(util::Split("a", " "), std::vector<std::string>{"a"});
  ASSERT_TRUE(util::Split("", " ").empty());
  ASSERT_EQ(util::Split("ab", ""), (std::vector<std::string>{"a", "b"}));
}

TEST(StringUtil, StringJoin) {
  std::vector<std::string> hashes = {"9q8yy", "9q8yz", "9q8zn"};
  ASSERT_EQ(util::StringJoin(hashes, [](const std::string &h) { return h; }), "9q8yy, 9q8yz, 9q8zn");
  ASSERT_EQ(util::StringJoin(
                hashes, [](const std::string &h) { return "'" + h + "'"; }, "|"),
            "'9q8yy'|'9q8yz'|'9q8zn'");
  ASSERT_EQ(util::StringJoin(std::vector<int>{}, [](int i) { return std::to_string(i); }), "");
  ASSERT_EQ(util::StringJoin(std::vector<int>{1, 2}, [](int i) { return std::to_string(i); }), "1, 2");
}

TEST(StringUtil, Float2String) {
  ASSERT_EQ(util::Float2String(25), "25");
  ASSERT_EQ(util::Float2String(0.5), "0.5");
  ASSERT_EQ(util::Float2String(std::numeric_limits<double>::infinity()), "inf");
  ASSERT_EQ(util::Float2String(-std::numeric_limits<double>::infinity()), "-inf");
}
