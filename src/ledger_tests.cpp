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

#include "ledger.hpp"

#include "testutils.hpp"

#include "database/dbtest.hpp"

#include <google/protobuf/text_format.h>

#include <gtest/gtest.h>

namespace bonds
{
namespace
{

using google::protobuf::TextFormat;

class LedgerTests : public DBTestWithSchema
{

protected:

  ContextForTesting ctx;
  Ledger ledger;

  LedgerTests ()
    : ledger(db, ctx)
  {
    Register (R"(
      name: "dai"
      permit: true
    )");
    Register (R"(
      name: "solace"
      governance: "gov"
      minters: "minter"
    )");
    Register (R"(
      name: "wchi"
      native: true
    )");

    ledger.Issue ("domob", "dai", 100);
  }

  void
  Register (const std::string& text)
  {
    proto::AssetConfig cfg;
    CHECK (TextFormat::ParseFromString (text, &cfg));
    ledger.RegisterAsset (cfg);
  }

};

TEST_F (LedgerTests, Registration)
{
  EXPECT_TRUE (ledger.AssetExists ("dai"));
  EXPECT_FALSE (ledger.AssetExists ("usdc"));

  EXPECT_TRUE (ledger.SupportsPermit ("dai"));
  EXPECT_FALSE (ledger.SupportsPermit ("solace"));
  EXPECT_FALSE (ledger.SupportsPermit ("usdc"));

  EXPECT_TRUE (ledger.IsNative ("wchi"));
  EXPECT_FALSE (ledger.IsNative ("dai"));

  EXPECT_TRUE (ledger.IsMinter ("solace", "minter"));
  EXPECT_FALSE (ledger.IsMinter ("dai", "minter"));
}

TEST_F (LedgerTests, Transfer)
{
  EXPECT_EQ (ledger.Transfer ("domob", "andy", "dai", 30), ErrorCode::OK);
  EXPECT_EQ (ledger.GetBalance ("domob", "dai"), 70);
  EXPECT_EQ (ledger.GetBalance ("andy", "dai"), 30);

  EXPECT_EQ (ledger.Transfer ("domob", "domob", "dai", 70), ErrorCode::OK);
  EXPECT_EQ (ledger.GetBalance ("domob", "dai"), 70);

  EXPECT_EQ (ledger.Transfer ("domob", "andy", "dai", 0), ErrorCode::OK);
  EXPECT_EQ (ledger.GetBalance ("domob", "dai"), 70);
}

TEST_F (LedgerTests, TransferErrors)
{
  EXPECT_EQ (ledger.Transfer ("domob", "andy", "usdc", 1),
             ErrorCode::UNKNOWN_ASSET);
  EXPECT_EQ (ledger.Transfer ("domob", "", "dai", 1),
             ErrorCode::INVALID_ADDRESS);
  EXPECT_EQ (ledger.Transfer ("domob", "andy", "dai", 101),
             ErrorCode::INSUFFICIENT_BALANCE);
  EXPECT_EQ (ledger.Transfer ("andy", "domob", "dai", 1),
             ErrorCode::INSUFFICIENT_BALANCE);

  EXPECT_EQ (ledger.GetBalance ("domob", "dai"), 100);
  EXPECT_EQ (ledger.GetBalance ("andy", "dai"), 0);
}

TEST_F (LedgerTests, ApproveAndTransferFrom)
{
  EXPECT_EQ (ledger.Approve ("domob", "", "dai", 50),
             ErrorCode::INVALID_ADDRESS);
  ASSERT_EQ (ledger.Approve ("domob", "andy", "dai", 50), ErrorCode::OK);
  EXPECT_EQ (ledger.GetAllowance ("domob", "andy", "dai"), 50);

  EXPECT_EQ (ledger.TransferFrom ("andy", "domob", "daniel", "dai", 51),
             ErrorCode::INSUFFICIENT_ALLOWANCE);
  EXPECT_EQ (ledger.TransferFrom ("daniel", "domob", "daniel", "dai", 1),
             ErrorCode::INSUFFICIENT_ALLOWANCE);

  ASSERT_EQ (ledger.TransferFrom ("andy", "domob", "daniel", "dai", 20),
             ErrorCode::OK);
  EXPECT_EQ (ledger.GetAllowance ("domob", "andy", "dai"), 30);
  EXPECT_EQ (ledger.GetBalance ("domob", "dai"), 80);
  EXPECT_EQ (ledger.GetBalance ("daniel", "dai"), 20);
}

TEST_F (LedgerTests, TransferFromInsufficientBalance)
{
  ASSERT_EQ (ledger.Approve ("domob", "andy", "dai", 500), ErrorCode::OK);
  EXPECT_EQ (ledger.TransferFrom ("andy", "domob", "andy", "dai", 101),
             ErrorCode::INSUFFICIENT_BALANCE);
  EXPECT_EQ (ledger.GetAllowance ("domob", "andy", "dai"), 500);
}

TEST_F (LedgerTests, Permit)
{
  ctx.SetTimestamp (1000);

  EXPECT_EQ (ledger.Permit ("domob", "andy", "solace", 10, 2000),
             ErrorCode::PERMIT_UNSUPPORTED);
  EXPECT_EQ (ledger.Permit ("domob", "andy", "usdc", 10, 2000),
             ErrorCode::PERMIT_UNSUPPORTED);
  EXPECT_EQ (ledger.Permit ("domob", "andy", "dai", 10, 999),
             ErrorCode::PERMIT_EXPIRED);
  EXPECT_EQ (ledger.GetAllowance ("domob", "andy", "dai"), 0);

  EXPECT_EQ (ledger.Permit ("domob", "andy", "dai", 10, 1000), ErrorCode::OK);
  EXPECT_EQ (ledger.GetAllowance ("domob", "andy", "dai"), 10);
}

TEST_F (LedgerTests, Mint)
{
  EXPECT_EQ (ledger.Mint ("domob", "andy", "solace", 10),
             ErrorCode::NOT_MINTER);
  EXPECT_EQ (ledger.Mint ("minter", "andy", "dai", 10),
             ErrorCode::NOT_MINTER);
  EXPECT_EQ (ledger.Mint ("minter", "andy", "usdc", 10),
             ErrorCode::UNKNOWN_ASSET);
  EXPECT_EQ (ledger.Mint ("minter", "", "solace", 10),
             ErrorCode::INVALID_ADDRESS);

  ASSERT_EQ (ledger.Mint ("minter", "andy", "solace", 10), ErrorCode::OK);
  EXPECT_EQ (ledger.GetBalance ("andy", "solace"), 10);
  EXPECT_EQ (MoneySupply (db).Get ("solace"), 10);

  EXPECT_EQ (ledger.Mint ("minter", "andy", "solace", MAX_AMOUNT - 9),
             ErrorCode::SUPPLY_OVERFLOW);
}

TEST_F (LedgerTests, Issue)
{
  ledger.Issue ("domob", "wchi", 5);
  ledger.Issue ("domob", "wchi", 0);
  EXPECT_EQ (ledger.GetBalance ("domob", "wchi"), 5);
  EXPECT_EQ (MoneySupply (db).Get ("wchi"), 5);
  EXPECT_DEATH (ledger.Issue ("domob", "usdc", 1), "unknown asset");
}

TEST_F (LedgerTests, Minters)
{
  EXPECT_EQ (ledger.AddMinter ("domob", "solace", "andy"),
             ErrorCode::NOT_GOVERNANCE);
  EXPECT_EQ (ledger.AddMinter ("gov", "usdc", "andy"),
             ErrorCode::UNKNOWN_ASSET);
  EXPECT_EQ (ledger.AddMinter ("gov", "solace", ""),
             ErrorCode::INVALID_ADDRESS);
  /* Assets without configured governance cannot get new minters.  */
  EXPECT_EQ (ledger.AddMinter ("", "dai", "andy"),
             ErrorCode::NOT_GOVERNANCE);

  ASSERT_EQ (ledger.AddMinter ("gov", "solace", "andy"), ErrorCode::OK);
  EXPECT_TRUE (ledger.IsMinter ("solace", "andy"));

  EXPECT_EQ (ledger.RemoveMinter ("andy", "solace", "minter"),
             ErrorCode::NOT_GOVERNANCE);
  ASSERT_EQ (ledger.RemoveMinter ("gov", "solace", "minter"), ErrorCode::OK);
  EXPECT_FALSE (ledger.IsMinter ("solace", "minter"));
}

TEST_F (LedgerTests, AssetGovernance)
{
  EXPECT_EQ (ledger.SetPendingGovernance ("gov", "usdc", "andy"),
             ErrorCode::UNKNOWN_ASSET);
  ASSERT_EQ (ledger.SetPendingGovernance ("gov", "solace", "andy"),
             ErrorCode::OK);
  ASSERT_EQ (ledger.AcceptGovernance ("andy", "solace"), ErrorCode::OK);

  EXPECT_EQ (ledger.AddMinter ("gov", "solace", "x"),
             ErrorCode::NOT_GOVERNANCE);
  EXPECT_EQ (ledger.AddMinter ("andy", "solace", "x"), ErrorCode::OK);
}

} // anonymous namespace
} // namespace bonds
