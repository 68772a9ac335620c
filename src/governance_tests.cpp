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

#include "governance.hpp"

#include "testutils.hpp"

#include "database/dbtest.hpp"

#include <gtest/gtest.h>

namespace bonds
{
namespace
{

class GovernanceTests : public DBTestWithSchema
{

protected:

  proto::Governance data;
  EventLog events;
  GovernanceRecord gov;

  GovernanceTests ()
    : events(db, 10), gov(data, events, "@component")
  {
    GovernanceRecord::Initialise (data, "domob");
  }

  /**
   * Returns the type of the last event emitted (or empty).
   */
  std::string
  LastEvent ()
  {
    auto res = events.QueryRecent (1);
    if (!res.Step ())
      return "";
    return res.Get<EventResult::type> ();
  }

};

TEST_F (GovernanceTests, Initialised)
{
  EXPECT_TRUE (gov.IsGovernance ("domob"));
  EXPECT_FALSE (gov.IsGovernance ("andy"));
  EXPECT_FALSE (gov.IsGovernance (""));
  EXPECT_EQ (gov.RequireGovernance ("domob"), ErrorCode::OK);
  EXPECT_EQ (gov.RequireGovernance ("andy"), ErrorCode::NOT_GOVERNANCE);
}

TEST_F (GovernanceTests, TwoPhaseTransfer)
{
  ASSERT_EQ (gov.SetPending ("domob", "andy"), ErrorCode::OK);
  EXPECT_EQ (LastEvent (), "GovernancePending");

  /* The current governor stays in charge until acceptance.  */
  EXPECT_TRUE (gov.IsGovernance ("domob"));
  EXPECT_FALSE (gov.IsGovernance ("andy"));

  ASSERT_EQ (gov.Accept ("andy"), ErrorCode::OK);
  EXPECT_EQ (LastEvent (), "GovernanceTransferred");
  EXPECT_FALSE (gov.IsGovernance ("domob"));
  EXPECT_TRUE (gov.IsGovernance ("andy"));
  EXPECT_EQ (data.pending (), "");

  EXPECT_EQ (gov.Accept ("andy"), ErrorCode::NOT_PENDING_GOVERNANCE);
}

TEST_F (GovernanceTests, Unauthorised)
{
  for (int i = 0; i < 2; ++i)
    {
      EXPECT_EQ (gov.SetPending ("andy", "andy"), ErrorCode::NOT_GOVERNANCE);
      EXPECT_EQ (gov.Accept ("andy"), ErrorCode::NOT_PENDING_GOVERNANCE);
    }
  EXPECT_EQ (LastEvent (), "");

  ASSERT_EQ (gov.SetPending ("domob", "andy"), ErrorCode::OK);
  EXPECT_EQ (gov.Accept ("daniel"), ErrorCode::NOT_PENDING_GOVERNANCE);
  EXPECT_EQ (gov.Accept ("domob"), ErrorCode::NOT_PENDING_GOVERNANCE);
}

TEST_F (GovernanceTests, ClearPending)
{
  ASSERT_EQ (gov.SetPending ("domob", "andy"), ErrorCode::OK);
  ASSERT_EQ (gov.SetPending ("domob", ""), ErrorCode::OK);
  EXPECT_EQ (gov.Accept ("andy"), ErrorCode::NOT_PENDING_GOVERNANCE);
  EXPECT_EQ (gov.Accept (""), ErrorCode::NOT_PENDING_GOVERNANCE);
}

} // anonymous namespace
} // namespace bonds
