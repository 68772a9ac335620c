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

#include "eventlog.hpp"

#include "dbtest.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

namespace bonds
{
namespace
{

class EventLogTests : public DBTestWithSchema
{

protected:

  /**
   * Parses a JSON string for the expected values.
   */
  static Json::Value
  Parse (const std::string& str)
  {
    Json::Value val;
    std::istringstream in(str);
    in >> val;
    return val;
  }

  /**
   * Extracts the event types in a result.
   */
  static std::vector<std::string>
  GetTypes (Database::Result<EventResult>&& res)
  {
    std::vector<std::string> types;
    while (res.Step ())
      types.push_back (res.Get<EventResult::type> ());
    return types;
  }

};

TEST_F (EventLogTests, EmitAndRead)
{
  db.SetNextId (100);

  EventLog log(db, 42);
  log.Emit ("@teller", "CreateBond", Parse (R"({"id": 1, "payout": 150})"));

  auto res = log.QueryRecent (10);
  ASSERT_TRUE (res.Step ());
  EXPECT_EQ (res.Get<EventResult::id> (), 1);
  EXPECT_EQ (res.Get<EventResult::height> (), 42);
  EXPECT_EQ (res.Get<EventResult::emitter> (), "@teller");
  EXPECT_EQ (res.Get<EventResult::type> (), "CreateBond");
  EXPECT_EQ (EventLog::GetArgs (res), Parse (R"({"id": 1, "payout": 150})"));
  EXPECT_FALSE (res.Step ());
}

TEST_F (EventLogTests, QueryRecentLimit)
{
  EventLog log(db, 1);
  log.Emit ("@a", "First", Json::Value (Json::objectValue));
  log.Emit ("@b", "Second", Json::Value (Json::objectValue));
  log.Emit ("@a", "Third", Json::Value (Json::objectValue));

  EXPECT_EQ (GetTypes (log.QueryRecent (10)),
             std::vector<std::string> ({"First", "Second", "Third"}));
  EXPECT_EQ (GetTypes (log.QueryRecent (2)),
             std::vector<std::string> ({"Second", "Third"}));
  EXPECT_EQ (GetTypes (log.QueryForEmitter ("@a", 10)),
             std::vector<std::string> ({"First", "Third"}));
  EXPECT_EQ (GetTypes (log.QueryForEmitter ("@a", 1)),
             std::vector<std::string> ({"Third"}));
}

TEST_F (EventLogTests, RemoveOld)
{
  const Json::Value noArgs(Json::objectValue);
  EventLog (db, 10).Emit ("@a", "First", noArgs);
  EventLog (db, 11).Emit ("@a", "Second", noArgs);
  EventLog (db, 12).Emit ("@a", "Third", noArgs);

  EventLog log(db, 15);
  log.RemoveOld (20);
  EXPECT_EQ (GetTypes (log.QueryRecent (10)),
             std::vector<std::string> ({"First", "Second", "Third"}));

  log.RemoveOld (5);
  EXPECT_EQ (GetTypes (log.QueryRecent (10)),
             std::vector<std::string> ({"Second", "Third"}));

  log.RemoveOld (3);
  EXPECT_TRUE (GetTypes (log.QueryRecent (10)).empty ());
}

TEST_F (EventLogTests, ArgsMustBeObject)
{
  EventLog log(db, 1);
  EXPECT_DEATH (log.Emit ("@a", "Invalid", Json::Value (5)),
                "must be an object");
}

} // anonymous namespace
} // namespace bonds
