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

#include "lockvault.hpp"

#include "testutils.hpp"

#include "database/dbtest.hpp"

#include <gtest/gtest.h>

namespace bonds
{
namespace
{

constexpr int64_t YEAR = 365 * 24 * 3'600;

class LockVaultTests : public DBTestWithSchema
{

protected:

  ContextForTesting ctx;
  Ledger ledger;
  LockVault vault;

  LockVaultTests ()
    : ledger(db, ctx), vault(db, ctx, ledger, "@vault")
  {
    proto::AssetConfig cfg;
    cfg.set_name ("solace");
    ledger.RegisterAsset (cfg);
    ledger.Issue ("domob", "solace", 100);

    ctx.SetTimestamp (1'000);
  }

};

TEST_F (LockVaultTests, ValidAddress)
{
  EXPECT_TRUE (LockVault::IsValidAddress ("@vault"));
  EXPECT_FALSE (LockVault::IsValidAddress ("@"));
  EXPECT_FALSE (LockVault::IsValidAddress ("domob"));
  EXPECT_FALSE (LockVault::IsValidAddress (""));
}

TEST_F (LockVaultTests, CreateLock)
{
  Database::IdT id;
  ASSERT_EQ (vault.CreateLock ("domob", "andy", "solace", 30, 2'000, id),
             ErrorCode::OK);

  EXPECT_EQ (ledger.GetBalance ("domob", "solace"), 70);
  EXPECT_EQ (ledger.GetBalance ("@vault", "solace"), 30);

  auto l = LocksTable (db).GetById (id);
  ASSERT_NE (l, nullptr);
  EXPECT_EQ (l->GetVault (), "@vault");
  EXPECT_EQ (l->GetOwner (), "andy");
  EXPECT_EQ (l->GetAsset (), "solace");
  EXPECT_EQ (l->GetAmount (), 30);
  EXPECT_EQ (l->GetEnd (), 2'000);
}

TEST_F (LockVaultTests, CreateLockErrors)
{
  Database::IdT id;

  EXPECT_EQ (vault.CreateLock ("domob", "", "solace", 30, 2'000, id),
             ErrorCode::INVALID_ADDRESS);
  EXPECT_EQ (vault.CreateLock ("domob", "andy", "dai", 30, 2'000, id),
             ErrorCode::UNKNOWN_ASSET);
  EXPECT_EQ (vault.CreateLock ("domob", "andy", "solace", 0, 2'000, id),
             ErrorCode::ZERO_AMOUNT);
  EXPECT_EQ (vault.CreateLock ("domob", "andy", "solace", 101, 2'000, id),
             ErrorCode::INSUFFICIENT_BALANCE);

  LockVault notSystem(db, ctx, ledger, "vault");
  EXPECT_EQ (notSystem.CreateLock ("domob", "andy", "solace", 1, 2'000, id),
             ErrorCode::INVALID_ADDRESS);

  EXPECT_EQ (ledger.GetBalance ("domob", "solace"), 100);
  EXPECT_FALSE (LocksTable (db).QueryAll ().Step ());
}

TEST_F (LockVaultTests, MaximumDuration)
{
  Database::IdT id;
  EXPECT_EQ (vault.CreateLock ("domob", "andy", "solace", 1,
                               1'000 + 4 * YEAR + 1, id),
             ErrorCode::LOCK_TOO_LONG);
  EXPECT_EQ (vault.CreateLock ("domob", "andy", "solace", 1,
                               1'000 + 4 * YEAR, id),
             ErrorCode::OK);
}

TEST_F (LockVaultTests, Withdraw)
{
  Database::IdT id;
  ASSERT_EQ (vault.CreateLock ("domob", "andy", "solace", 30, 2'000, id),
             ErrorCode::OK);

  EXPECT_EQ (vault.Withdraw ("andy", id + 1, "andy"),
             ErrorCode::NONEXISTENT_TOKEN);
  EXPECT_EQ (vault.Withdraw ("domob", id, "domob"),
             ErrorCode::NOT_LOCK_OWNER);
  EXPECT_EQ (vault.Withdraw ("andy", id, "andy"), ErrorCode::LOCKED);

  ctx.SetTimestamp (2'000);
  EXPECT_EQ (vault.Withdraw ("andy", id, ""), ErrorCode::INVALID_ADDRESS);

  ASSERT_EQ (vault.Withdraw ("andy", id, "daniel"), ErrorCode::OK);
  EXPECT_EQ (ledger.GetBalance ("daniel", "solace"), 30);
  EXPECT_EQ (ledger.GetBalance ("@vault", "solace"), 0);
  EXPECT_EQ (LocksTable (db).GetById (id), nullptr);

  EXPECT_EQ (vault.Withdraw ("andy", id, "andy"),
             ErrorCode::NONEXISTENT_TOKEN);
}

TEST_F (LockVaultTests, OtherVault)
{
  Database::IdT id;
  ASSERT_EQ (vault.CreateLock ("domob", "andy", "solace", 30, 1'000, id),
             ErrorCode::OK);

  LockVault other(db, ctx, ledger, "@other");
  EXPECT_EQ (other.Withdraw ("andy", id, "andy"),
             ErrorCode::NONEXISTENT_TOKEN);
}

TEST_F (LockVaultTests, Events)
{
  Database::IdT id;
  ASSERT_EQ (vault.CreateLock ("domob", "andy", "solace", 30, 1'000, id),
             ErrorCode::OK);
  ASSERT_EQ (vault.Withdraw ("andy", id, "andy"), ErrorCode::OK);

  EventLog log(db, 1);
  auto res = log.QueryForEmitter ("@vault", 10);

  ASSERT_TRUE (res.Step ());
  EXPECT_EQ (res.Get<EventResult::type> (), "CreateLock");
  EXPECT_TRUE (PartialJsonEqual (EventLog::GetArgs (res), ParseJson (R"({
    "owner": "andy",
    "amount": 30,
    "end": 1000
  })")));

  ASSERT_TRUE (res.Step ());
  EXPECT_EQ (res.Get<EventResult::type> (), "Withdraw");
  EXPECT_TRUE (PartialJsonEqual (EventLog::GetArgs (res), ParseJson (R"({
    "recipient": "andy",
    "amount": 30
  })")));

  EXPECT_FALSE (res.Step ());
}

} // anonymous namespace
} // namespace bonds
