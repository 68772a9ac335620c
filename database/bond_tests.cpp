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

#include "bond.hpp"

#include "dbtest.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace bonds
{
namespace
{

class BondTests : public DBTestWithSchema
{

protected:

  BondsTable tbl;

  BondTests ()
    : tbl(db)
  {}

  /**
   * Returns the IDs of all bonds in a result set.
   */
  static std::vector<Database::IdT>
  GetIds (Database::Result<BondResult>&& res)
  {
    std::vector<Database::IdT> ids;
    while (res.Step ())
      ids.push_back (res.Get<BondResult::id> ());
    return ids;
  }

};

TEST_F (BondTests, CreationAndRead)
{
  tbl.CreateNew ("@teller", 1, "domob", 300, 150, 1000, 500);

  auto b = tbl.GetById ("@teller", 1);
  ASSERT_NE (b, nullptr);
  EXPECT_EQ (b->GetTeller (), "@teller");
  EXPECT_EQ (b->GetId (), 1);
  EXPECT_EQ (b->GetOwner (), "domob");
  EXPECT_EQ (b->GetApproved (), "");
  EXPECT_EQ (b->GetPrincipalPaid (), 300);
  EXPECT_EQ (b->GetPayout (), 150);
  EXPECT_EQ (b->GetClaimed (), 0);
  EXPECT_EQ (b->GetVestingStart (), 1000);
  EXPECT_EQ (b->GetVestingTerm (), 500);
  EXPECT_FALSE (b->IsRedeemed ());

  EXPECT_EQ (tbl.GetById ("@teller", 2), nullptr);
  EXPECT_EQ (tbl.GetById ("@other", 1), nullptr);
}

TEST_F (BondTests, IdsPerTeller)
{
  tbl.CreateNew ("@a", 1, "domob", 1, 1, 0, 0);
  tbl.CreateNew ("@b", 1, "andy", 2, 2, 0, 0);

  EXPECT_EQ (tbl.GetById ("@a", 1)->GetOwner (), "domob");
  EXPECT_EQ (tbl.GetById ("@b", 1)->GetOwner (), "andy");
  EXPECT_DEATH (tbl.CreateNew ("@a", 1, "x", 1, 1, 0, 0), "exists already");
}

TEST_F (BondTests, OwnershipAndApproval)
{
  tbl.CreateNew ("@teller", 1, "domob", 10, 10, 0, 0);

  auto b = tbl.GetById ("@teller", 1);
  b->SetApproved ("andy");
  b.reset ();

  b = tbl.GetById ("@teller", 1);
  EXPECT_EQ (b->GetApproved (), "andy");
  b->SetOwner ("daniel");
  b.reset ();

  b = tbl.GetById ("@teller", 1);
  EXPECT_EQ (b->GetOwner (), "daniel");
  EXPECT_EQ (b->GetApproved (), "");
}

TEST_F (BondTests, PartialAndFullClaim)
{
  tbl.CreateNew ("@teller", 1, "domob", 10, 100, 0, 0);

  auto b = tbl.GetById ("@teller", 1);
  b->AddClaimed (40);
  b.reset ();

  b = tbl.GetById ("@teller", 1);
  EXPECT_EQ (b->GetClaimed (), 40);
  EXPECT_DEATH (b->AddClaimed (61), "more than the payout");
  b->AddClaimed (60);
  EXPECT_TRUE (b->IsRedeemed ());
  b.reset ();

  EXPECT_EQ (tbl.GetById ("@teller", 1), nullptr);
}

TEST_F (BondTests, Queries)
{
  tbl.CreateNew ("@b", 2, "domob", 1, 1, 0, 0);
  tbl.CreateNew ("@a", 5, "domob", 1, 1, 0, 0);
  tbl.CreateNew ("@b", 1, "andy", 1, 1, 0, 0);
  tbl.CreateNew ("@a", 3, "domob", 1, 1, 0, 0);

  EXPECT_EQ (GetIds (tbl.QueryAll ()),
             std::vector<Database::IdT> ({3, 5, 1, 2}));
  EXPECT_EQ (GetIds (tbl.QueryForOwner ("domob")),
             std::vector<Database::IdT> ({3, 5, 2}));
  EXPECT_EQ (GetIds (tbl.QueryForTeller ("@b")),
             std::vector<Database::IdT> ({1, 2}));
}

TEST_F (BondTests, Operators)
{
  EXPECT_FALSE (tbl.IsOperator ("@teller", "domob", "andy"));

  tbl.SetOperator ("@teller", "domob", "andy", true);
  tbl.SetOperator ("@teller", "domob", "andy", true);
  EXPECT_TRUE (tbl.IsOperator ("@teller", "domob", "andy"));
  EXPECT_FALSE (tbl.IsOperator ("@teller", "andy", "domob"));
  EXPECT_FALSE (tbl.IsOperator ("@other", "domob", "andy"));

  tbl.SetOperator ("@teller", "domob", "andy", false);
  EXPECT_FALSE (tbl.IsOperator ("@teller", "domob", "andy"));
}

} // anonymous namespace
} // namespace bonds
