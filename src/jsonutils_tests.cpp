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

#include "jsonutils.hpp"

#include "testutils.hpp"

#include <gtest/gtest.h>

#include <glog/logging.h>

#include <limits>

namespace bonds
{
namespace
{

using AssetAmountJsonTests = testing::Test;

TEST_F (AssetAmountJsonTests, Valid)
{
  Amount a;

  ASSERT_TRUE (AssetAmountFromJson (ParseJson ("0"), a));
  EXPECT_EQ (a, 0);

  ASSERT_TRUE (AssetAmountFromJson (ParseJson ("42"), a));
  EXPECT_EQ (a, 42);

  ASSERT_TRUE (AssetAmountFromJson (ParseJson ("1000000000000000000"), a));
  EXPECT_EQ (a, MAX_AMOUNT);
}

TEST_F (AssetAmountJsonTests, OutOfRange)
{
  Amount a;
  EXPECT_FALSE (AssetAmountFromJson (ParseJson ("-1"), a));
  EXPECT_FALSE (AssetAmountFromJson (ParseJson ("-50"), a));
  EXPECT_FALSE (AssetAmountFromJson (ParseJson ("1000000000000000001"), a));
}

TEST_F (AssetAmountJsonTests, InvalidType)
{
  Amount a;
  EXPECT_FALSE (AssetAmountFromJson (ParseJson ("null"), a));
  EXPECT_FALSE (AssetAmountFromJson (ParseJson ("\"42\""), a));
  EXPECT_FALSE (AssetAmountFromJson (ParseJson ("1.5"), a));
  EXPECT_FALSE (AssetAmountFromJson (ParseJson ("10.0"), a));
  EXPECT_FALSE (AssetAmountFromJson (ParseJson ("1e2"), a));
}

using TimeFromJsonTests = testing::Test;

TEST_F (TimeFromJsonTests, Valid)
{
  int64_t t;

  ASSERT_TRUE (TimeFromJson (ParseJson ("0"), t));
  EXPECT_EQ (t, 0);

  ASSERT_TRUE (TimeFromJson (ParseJson ("1650000000"), t));
  EXPECT_EQ (t, 1'650'000'000);
}

TEST_F (TimeFromJsonTests, Invalid)
{
  for (const std::string str : {"{}", "null", "true", "\"5\"",
                                "-1", "1.5", "2e2", "1000000000001"})
    {
      int64_t t;
      EXPECT_FALSE (TimeFromJson (ParseJson (str), t)) << str;
    }
}

using AddressFromJsonTests = testing::Test;

TEST_F (AddressFromJsonTests, Works)
{
  std::string addr;

  ASSERT_TRUE (AddressFromJson (ParseJson ("\"domob\""), addr));
  EXPECT_EQ (addr, "domob");

  ASSERT_TRUE (AddressFromJson (ParseJson ("\"\""), addr));
  EXPECT_EQ (addr, "");

  EXPECT_FALSE (AddressFromJson (ParseJson ("42"), addr));
  EXPECT_FALSE (AddressFromJson (ParseJson ("null"), addr));
  EXPECT_FALSE (AddressFromJson (ParseJson ("[\"domob\"]"), addr));
}

using IdFromJsonTests = testing::Test;

TEST_F (IdFromJsonTests, Valid)
{
  Database::IdT id;

  ASSERT_TRUE (IdFromJson (ParseJson ("1"), id));
  EXPECT_EQ (id, 1);

  ASSERT_TRUE (IdFromJson (ParseJson ("42"), id));
  EXPECT_EQ (id, 42);

  ASSERT_TRUE (IdFromJson (ParseJson ("999999999998"), id));
  EXPECT_EQ (id, 999'999'999'998);
}

TEST_F (IdFromJsonTests, Invalid)
{
  for (const std::string str : {"{}", "null",
                                "0", "999999999999",
                                "-10", "1.5", "42.0", "2e2"})
    {
      Database::IdT id;
      EXPECT_FALSE (IdFromJson (ParseJson (str), id)) << str;
    }
}

using IntToJsonTests = testing::Test;

TEST_F (IntToJsonTests, UInt)
{
  const Json::Value res = IntToJson (std::numeric_limits<uint32_t>::max ());
  ASSERT_TRUE (res.isUInt ());
  EXPECT_FALSE (res.isInt ());
  EXPECT_EQ (res.asUInt (), std::numeric_limits<uint32_t>::max ());
}

TEST_F (IntToJsonTests, Int)
{
  const Json::Value res = IntToJson (std::numeric_limits<int32_t>::min ());
  ASSERT_TRUE (res.isInt ());
  EXPECT_FALSE (res.isUInt ());
  EXPECT_EQ (res.asInt (), std::numeric_limits<int32_t>::min ());
}

TEST_F (IntToJsonTests, UInt64)
{
  const Json::Value res = IntToJson (std::numeric_limits<uint64_t>::max ());
  ASSERT_TRUE (res.isUInt64 ());
  EXPECT_FALSE (res.isInt64 ());
  EXPECT_FALSE (res.isUInt ());
  EXPECT_EQ (res.asUInt64 (), std::numeric_limits<uint64_t>::max ());
}

TEST_F (IntToJsonTests, Int64)
{
  const Json::Value res = IntToJson (std::numeric_limits<int64_t>::min ());
  ASSERT_TRUE (res.isInt64 ());
  EXPECT_FALSE (res.isUInt64 ());
  EXPECT_FALSE (res.isInt ());
  EXPECT_EQ (res.asInt64 (), std::numeric_limits<int64_t>::min ());
}


} // anonymous namespace
} // namespace bonds
