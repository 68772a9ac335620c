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

#include "lazyproto.hpp"

#include "proto/governance.pb.h"

#include <gtest/gtest.h>

namespace bonds
{

class LazyProtoTests : public testing::Test
{

protected:

  LazyProto<proto::Governance> lazy;

  /**
   * Sets our LazyProto instance to a governance record with the given
   * current and pending governor.
   */
  void
  SetToGovernance (const std::string& current, const std::string& pending)
  {
    proto::Governance pb;
    pb.set_current (current);
    pb.set_pending (pending);

    std::string bytes;
    CHECK (pb.SerializeToString (&bytes));

    lazy = LazyProto<proto::Governance> (std::move (bytes));
  }

  /**
   * Checks if the protocol buffer has been parsed.
   */
  bool
  IsProtoParsed () const
  {
    return lazy.msg.has_current () || lazy.msg.has_pending ();
  }

  /**
   * Checks that the protocol buffer is not serialised on demand for
   * GetSerialised, but that a serialised string is known already and returned.
   * We do this by modifying the proto message and checking that the serialised
   * string does not change.
   */
  bool
  IsSerialisationCached ()
  {
    const std::string before = lazy.GetSerialised ();
    lazy.msg.set_current ("changed");
    const std::string after = lazy.GetSerialised ();

    return before == after;
  }

};

namespace
{

TEST_F (LazyProtoTests, SetToDefault)
{
  SetToGovernance ("gov", "next");

  lazy.SetToDefault ();
  EXPECT_EQ (lazy.GetSerialised (), "");
  EXPECT_FALSE (lazy.Get ().has_current ());
  EXPECT_FALSE (lazy.Get ().has_pending ());

  EXPECT_FALSE (lazy.IsDirty ());
  EXPECT_TRUE (IsSerialisationCached ());
}

TEST_F (LazyProtoTests, ProtoNotParsed)
{
  SetToGovernance ("gov", "next");
  const std::string bytes = lazy.GetSerialised ();

  EXPECT_FALSE (lazy.IsDirty ());
  EXPECT_FALSE (IsProtoParsed ());
  EXPECT_TRUE (IsSerialisationCached ());

  proto::Governance pb;
  ASSERT_TRUE (pb.ParseFromString (bytes));
  EXPECT_EQ (pb.current (), "gov");
  EXPECT_EQ (pb.pending (), "next");
}

TEST_F (LazyProtoTests, ProtoNotModified)
{
  SetToGovernance ("gov", "next");

  EXPECT_EQ (lazy.Get ().current (), "gov");
  EXPECT_EQ (lazy.Get ().pending (), "next");

  EXPECT_FALSE (lazy.IsDirty ());
  EXPECT_TRUE (IsProtoParsed ());
  EXPECT_TRUE (IsSerialisationCached ());
}

TEST_F (LazyProtoTests, ProtoModified)
{
  SetToGovernance ("gov", "next");
  lazy.Mutable ().clear_pending ();
  const std::string bytes = lazy.GetSerialised ();

  EXPECT_EQ (lazy.Get ().current (), "gov");
  EXPECT_FALSE (lazy.Get ().has_pending ());

  EXPECT_TRUE (lazy.IsDirty ());
  EXPECT_TRUE (IsProtoParsed ());
  EXPECT_FALSE (IsSerialisationCached ());

  proto::Governance pb;
  ASSERT_TRUE (pb.ParseFromString (bytes));
  EXPECT_EQ (pb.current (), "gov");
  EXPECT_FALSE (pb.has_pending ());
}

TEST_F (LazyProtoTests, UninitialisedAccess)
{
  EXPECT_DEATH (lazy.Get (), "Accessing uninitialised .*Governance");
  EXPECT_DEATH (lazy.IsDirty (), "uninitialised .*Governance");
  EXPECT_DEATH (lazy.GetSerialised (), "Serialising uninitialised");
}

TEST_F (LazyProtoTests, CorruptData)
{
  lazy = LazyProto<proto::Governance> (std::string ("\xff"));
  EXPECT_FALSE (IsProtoParsed ());
  EXPECT_DEATH (lazy.Get (), "Invalid .*Governance data");
}

} // anonymous namespace
} // namespace bonds
