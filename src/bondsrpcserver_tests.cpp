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

#include "bondsrpcserver.hpp"

#include "testutils.hpp"

#include <gtest/gtest.h>

#include <jsonrpccpp/common/exception.h>

namespace bonds
{
namespace
{

using QuoteArgumentsTests = testing::Test;

/**
 * Expects that parsing the given quote fails with the invalid-argument
 * JSON-RPC error.
 */
void
ExpectInvalid (const std::string& quote, const bool withAmount)
{
  try
    {
      QuoteArguments::Parse (ParseJson (quote), withAmount);
      FAIL () << "Quote parsed successfully: " << quote;
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      EXPECT_EQ (exc.GetCode (), -1) << quote;
    }
}

TEST_F (QuoteArgumentsTests, WithAmount)
{
  auto args = QuoteArguments::Parse (ParseJson (R"({
    "amount": 1000,
    "timestamp": 42
  })"), true);
  EXPECT_EQ (args.amount, 1'000);
  EXPECT_EQ (args.timestamp, 42);
  EXPECT_FALSE (args.stake);

  args = QuoteArguments::Parse (ParseJson (R"({
    "amount": 0,
    "timestamp": 0,
    "stake": true
  })"), true);
  EXPECT_EQ (args.amount, 0);
  EXPECT_EQ (args.timestamp, 0);
  EXPECT_TRUE (args.stake);
}

TEST_F (QuoteArgumentsTests, TimestampOnly)
{
  const auto args = QuoteArguments::Parse (ParseJson (R"({
    "timestamp": 1600000000
  })"), false);
  EXPECT_EQ (args.amount, 0);
  EXPECT_EQ (args.timestamp, 1'600'000'000);
}

TEST_F (QuoteArgumentsTests, TimestampBeyondInt32)
{
  const auto args = QuoteArguments::Parse (ParseJson (R"({
    "timestamp": 5000000000
  })"), false);
  EXPECT_EQ (args.timestamp, 5'000'000'000);

  const auto withAmount = QuoteArguments::Parse (ParseJson (R"({
    "amount": 10,
    "timestamp": 5000000000
  })"), true);
  EXPECT_EQ (withAmount.timestamp, 5'000'000'000);
}

TEST_F (QuoteArgumentsTests, Invalid)
{
  ExpectInvalid ("42", false);
  ExpectInvalid ("[]", true);
  ExpectInvalid ("{}", false);
  ExpectInvalid (R"({"timestamp": -1})", false);
  ExpectInvalid (R"({"timestamp": 1.5})", false);
  ExpectInvalid (R"({"timestamp": "42"})", false);
  ExpectInvalid (R"({"amount": 10, "timestamp": 42})", false);
  ExpectInvalid (R"({"timestamp": 42})", true);
  ExpectInvalid (R"({"amount": -1, "timestamp": 42})", true);
  ExpectInvalid (R"({"amount": 10, "timestamp": 42, "stake": 1})", true);
}

} // anonymous namespace
} // namespace bonds
