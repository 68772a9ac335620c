/*
    GSP for the Bond Sale Engine
    Copyright (C) 2019-2020  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "testutils.hpp"

#include <gtest/gtest.h>

namespace bonds
{
namespace
{

/* ************************************************************************** */

using ContextForTestingTests = testing::Test;

TEST_F (ContextForTestingTests, Defaults)
{
  const ContextForTesting ctx;
  EXPECT_EQ (ctx.Chain (), xaya::Chain::REGTEST);
  EXPECT_EQ (ctx.Height (), 1);
  EXPECT_EQ (ctx.Timestamp (), 0);
}

TEST_F (ContextForTestingTests, Setters)
{
  ContextForTesting ctx;
  ctx.SetHeight (42);
  ctx.SetTimestamp (1000);
  ctx.SetChain (xaya::Chain::MAIN);

  EXPECT_EQ (ctx.Chain (), xaya::Chain::MAIN);
  EXPECT_EQ (ctx.Height (), 42);
  EXPECT_EQ (ctx.Timestamp (), 1000);
}

/* ************************************************************************** */

class PartialJsonEqualTests : public testing::Test
{

protected:

  static bool
  Matches (const std::string& actual, const std::string& expected)
  {
    return PartialJsonEqual (ParseJson (actual), ParseJson (expected));
  }

};

TEST_F (PartialJsonEqualTests, Scalars)
{
  EXPECT_TRUE (Matches ("100", "100"));
  EXPECT_TRUE (Matches ("false", "false"));
  EXPECT_TRUE (Matches ("\"@depo\"", "\"@depo\""));

  EXPECT_FALSE (Matches ("100", "101"));
  EXPECT_FALSE (Matches ("2", "2.5"));
  EXPECT_FALSE (Matches ("\"alice\"", "\"bob\""));
  EXPECT_FALSE (Matches ("true", "1"));
}

TEST_F (PartialJsonEqualTests, LiteralNull)
{
  EXPECT_TRUE (Matches ("null", "\"null\""));
  EXPECT_FALSE (Matches ("\"null\"", "null"));
  EXPECT_FALSE (Matches ("0", "\"null\""));
}

TEST_F (PartialJsonEqualTests, ObjectFieldsAreSubset)
{
  const std::string bond = R"({
    "teller": "@teller",
    "id": 3,
    "owner": "alice",
    "payout": 500
  })";

  EXPECT_TRUE (Matches (bond, "{}"));
  EXPECT_TRUE (Matches (bond, R"({"owner": "alice", "id": 3})"));
  EXPECT_TRUE (Matches (bond, R"({"approved": null})"));

  EXPECT_FALSE (Matches (bond, R"({"owner": null})"));
  EXPECT_FALSE (Matches (bond, R"({"owner": "bob"})"));
  EXPECT_FALSE (Matches (bond, R"({"claimed": 0})"));
  EXPECT_FALSE (Matches (bond, "[]"));
  EXPECT_FALSE (Matches ("[]", "{}"));
}

TEST_F (PartialJsonEqualTests, ArraysMatchExactly)
{
  EXPECT_TRUE (Matches ("[]", "[]"));
  EXPECT_TRUE (Matches (R"(["@a", 2, true])", R"(["@a", 2, true])"));

  EXPECT_FALSE (Matches ("[1, 2]", "[1]"));
  EXPECT_FALSE (Matches ("[1]", "[1, 2]"));
  EXPECT_FALSE (Matches ("[2, 1]", "[1, 2]"));
  EXPECT_FALSE (Matches ("{}", "[]"));
}

TEST_F (PartialJsonEqualTests, NestedState)
{
  const std::string state = R"({
    "tellers": [
      {
        "address": "@teller",
        "paused": false,
        "terms": {"capacity": 10, "vesting": 100}
      }
    ],
    "balances": {"alice": {"dai": 5}}
  })";

  EXPECT_TRUE (Matches (state, R"({
    "tellers": [{"terms": {"vesting": 100}}],
    "balances": {"alice": {}}
  })"));

  EXPECT_FALSE (Matches (state, R"({
    "tellers": [{"terms": {"vesting": 200}}]
  })"));
  EXPECT_FALSE (Matches (state, R"({
    "tellers": [{}, {}]
  })"));
  EXPECT_FALSE (Matches (state, R"({
    "balances": {"alice": {"dai": null}}
  })"));
}

/* ************************************************************************** */

} // anonymous namespace
} // namespace bonds
