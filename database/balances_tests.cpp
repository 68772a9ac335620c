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

#include "balances.hpp"

#include "dbtest.hpp"

#include <gtest/gtest.h>

namespace bonds
{
namespace
{

class BalancesTests : public DBTestWithSchema
{

protected:

  Balances tbl;

  BalancesTests ()
    : tbl(db)
  {}

  /**
   * Returns the number of rows in the balances table.
   */
  unsigned
  CountRows ()
  {
    auto res = tbl.QueryAll ();
    unsigned cnt = 0;
    while (res.Step ())
      ++cnt;
    return cnt;
  }

};

TEST_F (BalancesTests, DefaultIsZero)
{
  EXPECT_EQ (tbl.Get ("domob", "dai"), 0);
  EXPECT_EQ (tbl.GetAllowance ("domob", "andy", "dai"), 0);
}

TEST_F (BalancesTests, AddAndGet)
{
  tbl.Add ("domob", "dai", 100);
  tbl.Add ("domob", "dai", -30);
  tbl.Add ("domob", "usdc", 5);
  tbl.Add ("andy", "dai", 1);

  EXPECT_EQ (tbl.Get ("domob", "dai"), 70);
  EXPECT_EQ (tbl.Get ("domob", "usdc"), 5);
  EXPECT_EQ (tbl.Get ("andy", "dai"), 1);
  EXPECT_EQ (tbl.Get ("andy", "usdc"), 0);
}

TEST_F (BalancesTests, ZeroRowsRemoved)
{
  tbl.Add ("domob", "dai", 10);
  tbl.Add ("andy", "dai", 10);
  EXPECT_EQ (CountRows (), 2);

  tbl.Add ("domob", "dai", -10);
  EXPECT_EQ (CountRows (), 1);
  EXPECT_EQ (tbl.Get ("domob", "dai"), 0);
}

TEST_F (BalancesTests, InvalidBalance)
{
  tbl.Add ("domob", "dai", 10);
  EXPECT_DEATH (tbl.Add ("domob", "dai", -11), "Negative balance");
  tbl.Add ("domob", "dai", MAX_AMOUNT - 10);
  EXPECT_DEATH (tbl.Add ("domob", "dai", 1), "MAX_AMOUNT");
}

TEST_F (BalancesTests, QueryForAccount)
{
  tbl.Add ("domob", "usdc", 2);
  tbl.Add ("domob", "dai", 1);
  tbl.Add ("andy", "dai", 3);

  auto res = tbl.QueryForAccount ("domob");
  ASSERT_TRUE (res.Step ());
  EXPECT_EQ (res.Get<BalanceResult::asset> (), "dai");
  EXPECT_EQ (res.Get<BalanceResult::amount> (), 1);
  ASSERT_TRUE (res.Step ());
  EXPECT_EQ (res.Get<BalanceResult::asset> (), "usdc");
  EXPECT_EQ (res.Get<BalanceResult::amount> (), 2);
  EXPECT_FALSE (res.Step ());
}

TEST_F (BalancesTests, Allowances)
{
  tbl.SetAllowance ("domob", "andy", "dai", 50);
  tbl.SetAllowance ("domob", "andy", "usdc", 20);
  tbl.SetAllowance ("domob", "andy", "dai", 40);

  EXPECT_EQ (tbl.GetAllowance ("domob", "andy", "dai"), 40);
  EXPECT_EQ (tbl.GetAllowance ("domob", "andy", "usdc"), 20);
  EXPECT_EQ (tbl.GetAllowance ("andy", "domob", "dai"), 0);

  tbl.SetAllowance ("domob", "andy", "usdc", 0);
  auto res = tbl.QueryAllowances ();
  ASSERT_TRUE (res.Step ());
  EXPECT_EQ (res.Get<AllowanceResult::asset> (), "dai");
  EXPECT_EQ (res.Get<AllowanceResult::amount> (), 40);
  EXPECT_FALSE (res.Step ());
}

} // anonymous namespace
} // namespace bonds
