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

#include "errors.hpp"

#include <gtest/gtest.h>

#include <set>
#include <sstream>

namespace bonds
{
namespace
{

using ErrorsTests = testing::Test;

TEST_F (ErrorsTests, ReasonStrings)
{
  EXPECT_EQ (ErrorToString (ErrorCode::AT_CAPACITY), "bond at capacity");
  EXPECT_EQ (ErrorToString (ErrorCode::SLIPPAGE), "slippage protection");
  EXPECT_EQ (ErrorToString (ErrorCode::ZERO_DENOMINATOR), "1/0");
  EXPECT_EQ (ErrorToString (ErrorCode::NOT_BONDER), "!bonder");

  std::ostringstream out;
  out << ErrorCode::PERMIT_EXPIRED;
  EXPECT_EQ (out.str (), "permit expired");
}

TEST_F (ErrorsTests, AllDistinct)
{
  std::set<std::string> seen;
  for (int i = static_cast<int> (ErrorCode::OK);
       i <= static_cast<int> (ErrorCode::UNKNOWN_DEPOSITORY); ++i)
    {
      const auto str = ErrorToString (static_cast<ErrorCode> (i));
      EXPECT_TRUE (seen.insert (str).second) << "Duplicate: " << str;
    }
}

} // anonymous namespace
} // namespace bonds
