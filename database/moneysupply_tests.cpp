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

#include "moneysupply.hpp"

#include "dbtest.hpp"

#include <gtest/gtest.h>

namespace bonds
{
namespace
{

class MoneySupplyTests : public DBTestWithSchema
{

protected:

  MoneySupply m;

  MoneySupplyTests ()
    : m(db)
  {
    m.InitialiseAsset ("solace");
    m.InitialiseAsset ("wchi");
  }

};

TEST_F (MoneySupplyTests, GetAndIncrement)
{
  EXPECT_EQ (m.Get ("solace"), 0);
  EXPECT_EQ (m.Get ("wchi"), 0);

  m.Increment ("solace", 42);
  m.Increment ("solace", 100);
  m.Increment ("wchi", 1);

  EXPECT_EQ (m.Get ("solace"), 142);
  EXPECT_EQ (m.Get ("wchi"), 1);
}

TEST_F (MoneySupplyTests, UpToMaximum)
{
  m.Increment ("solace", MAX_AMOUNT - 1);
  m.Increment ("solace", 1);
  EXPECT_EQ (m.Get ("solace"), MAX_AMOUNT);
  EXPECT_DEATH (m.Increment ("solace", 1), "would exceed the maximum");
}

TEST_F (MoneySupplyTests, DoubleInitialisation)
{
  EXPECT_DEATH (m.InitialiseAsset ("solace"), "UNIQUE constraint failed");
}

TEST_F (MoneySupplyTests, InvalidCalls)
{
  EXPECT_DEATH (m.Get ("invalid"), "Invalid asset: invalid");
  EXPECT_DEATH (m.Increment ("invalid", 1), "Invalid asset: invalid");
  EXPECT_DEATH (m.Increment ("solace", 0), "value > 0");
  EXPECT_DEATH (m.Increment ("solace", -10), "value > 0");
}

} // anonymous namespace
} // namespace bonds
