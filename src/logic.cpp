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

#include "logic.hpp"

#include "bonddepository.hpp"
#include "ledger.hpp"
#include "moveprocessor.hpp"

#include "database/asset.hpp"
#include "database/balances.hpp"
#include "database/bond.hpp"
#include "database/depository.hpp"
#include "database/eventlog.hpp"
#include "database/lock.hpp"
#include "database/moneysupply.hpp"
#include "database/schema.hpp"
#include "database/teller.hpp"

#include <glog/logging.h>

#include <map>
#include <utility>

namespace bonds
{

SQLiteGameDatabase::SQLiteGameDatabase (xaya::SQLiteDatabase& d, BondsLogic& g)
  : game(g)
{
  SetDatabase (d);
}

Database::IdT
SQLiteGameDatabase::GetNextId ()
{
  return game.Ids ("bonds").GetNext ();
}

Database::IdT
SQLiteGameDatabase::GetLogId ()
{
  return game.Ids ("log").GetNext ();
}

void
BondsLogic::UpdateState (Database& db, const xaya::Chain chain,
                         const Json::Value& blockData)
{
  const auto& blockMeta = blockData["block"];
  CHECK (blockMeta.isObject ());
  const auto& heightVal = blockMeta["height"];
  CHECK (heightVal.isUInt64 ());
  const unsigned height = heightVal.asUInt64 ();
  const auto& timestampVal = blockMeta["timestamp"];
  CHECK (timestampVal.isInt64 ());
  const int64_t timestamp = timestampVal.asInt64 ();

  const Context ctx(chain, height, timestamp);
  UpdateState (db, ctx, blockData);
}

void
BondsLogic::UpdateState (Database& db, const Context& ctx,
                         const Json::Value& blockData)
{
  EventLog events(db, ctx.Height ());
  events.RemoveOld (ctx.RoConfig ()->params ().event_blocks ());

  MoveProcessor mvProc(db, ctx);
  mvProc.ProcessAll (blockData["moves"]);

#ifdef ENABLE_SLOW_ASSERTS
  ValidateStateSlow (db, ctx);
#endif // ENABLE_SLOW_ASSERTS
}

void
BondsLogic::InitialiseFromConfig (Database& db, const Context& ctx)
{
  const auto& cfg = ctx.RoConfig ();
  Ledger ledger(db, ctx);

  for (const auto& a : cfg->assets ())
    ledger.RegisterAsset (a);

  for (const auto& d : cfg->depositories ())
    {
      CHECK (ledger.AssetExists (d.reward ()))
          << "Depository " << d.address ()
          << " has unknown reward asset " << d.reward ();
      BondDepository::Initialise (db, d);
    }

  for (const auto& b : cfg->initial_balances ())
    {
      LOG (INFO)
          << "Initial balance of " << b.amount () << " " << b.asset ()
          << " for " << b.account ();
      ledger.Issue (b.account (), b.asset (), b.amount ());
    }
}

void
BondsLogic::SetupSchema (xaya::SQLiteDatabase& db)
{
  SetupDatabaseSchema (db);
}

void
BondsLogic::GetInitialStateBlock (unsigned& height,
                                  std::string& hashHex) const
{
  const xaya::Chain chain = GetChain ();
  switch (chain)
    {
    case xaya::Chain::MAIN:
      height = 2'128'750;
      hashHex
          = "f7b5247531e0b2aabafa1219d6bdaf695bef95cfc2409c18d5286c7896912961";
      break;

    case xaya::Chain::TEST:
      height = 112'000;
      hashHex
          = "9c5b83a5caaf7f4ce17cc1f38fdb1ed3e3e3e98e43d23d19a4810767d7df38b9";
      break;

    case xaya::Chain::REGTEST:
      height = 0;
      hashHex
          = "6f750b36d22f1dc3d0a6e483af45301022646dfc3b3ba2187865f5a7d6d83ab1";
      break;

    default:
      LOG (FATAL) << "Unexpected chain: " << xaya::ChainToString (chain);
    }
}

void
BondsLogic::InitialiseState (xaya::SQLiteDatabase& db)
{
  SQLiteGameDatabase dbObj(db, *this);

  unsigned height;
  std::string hashHex;
  GetInitialStateBlock (height, hashHex);

  const Context ctx(GetChain (), height, Context::NO_TIMESTAMP);
  InitialiseFromConfig (dbObj, ctx);
}

void
BondsLogic::UpdateState (xaya::SQLiteDatabase& db,
                         const Json::Value& blockData)
{
  SQLiteGameDatabase dbObj(db, *this);
  UpdateState (dbObj, GetChain (), blockData);
}

Json::Value
BondsLogic::GetStateAsJson (const xaya::SQLiteDatabase& db)
{
  SQLiteGameDatabase dbObj(const_cast<xaya::SQLiteDatabase&> (db), *this);
  const Context ctx(GetChain (), Context::NO_HEIGHT, Context::NO_TIMESTAMP);
  GameStateJson gsj(dbObj, ctx);

  return gsj.FullState ();
}

Json::Value
BondsLogic::GetCustomStateData (xaya::Game& game, const JsonStateFromRawDb& cb)
{
  return SQLiteGame::GetCustomStateData (game, "data",
      [this, &cb] (const xaya::SQLiteDatabase& db, const xaya::uint256& hash,
                   const unsigned height)
        {
          SQLiteGameDatabase dbObj(const_cast<xaya::SQLiteDatabase&> (db),
                                   *this);
          return cb (dbObj, hash, height);
        });
}

Json::Value
BondsLogic::GetCustomStateData (xaya::Game& game,
                                const JsonStateFromDatabase& cb)
{
  return GetCustomStateData (game,
    [this, &cb] (Database& db, const xaya::uint256& hash, const unsigned height)
        {
          const Context ctx(GetChain (), height, Context::NO_TIMESTAMP);
          GameStateJson gsj(db, ctx);
          return cb (gsj);
        });
}

namespace
{

/**
 * Verifies that the money supply of each asset matches the sum of all
 * balances in it.
 */
void
ValidateSupply (Database& db)
{
  std::map<std::string, Amount> sums;
  {
    Balances balances(db);
    auto res = balances.QueryAll ();
    while (res.Step ())
      {
        const auto amount = res.Get<BalanceResult::amount> ();
        CHECK_GE (amount, 0)
            << "Negative balance of " << res.Get<BalanceResult::account> ()
            << " in " << res.Get<BalanceResult::asset> ();
        sums[res.Get<BalanceResult::asset> ()] += amount;
      }
  }

  AssetsTable assets(db);
  MoneySupply supply(db);
  auto res = assets.QueryAll ();
  while (res.Step ())
    {
      const std::string name = res.Get<AssetResult::name> ();
      CHECK_EQ (supply.Get (name), sums[name])
          << "Supply of " << name << " does not match balances";
      sums.erase (name);
    }

  for (const auto& entry : sums)
    CHECK_EQ (entry.second, 0)
        << "Balances in unknown asset " << entry.first;
}

/**
 * Verifies that tellers refer to existing depositories and that their
 * sale state is consistent.
 */
void
ValidateTellers (Database& db)
{
  DepositoriesTable depositories(db);
  TellersTable tellers(db);

  auto res = tellers.QueryAll ();
  while (res.Step ())
    {
      auto t = tellers.GetFromResult (res);
      const auto& pb = t->GetProto ();

      CHECK (depositories.GetByAddress (t->GetDepository ()) != nullptr)
          << "Teller " << t->GetAddress ()
          << " refers to non-existing depository " << t->GetDepository ();
      CHECK_GE (pb.num_bonds (), 0);
      CHECK_LE (pb.protocol_fee_bps (), 10'000u)
          << "Teller " << t->GetAddress () << " has invalid fee";

      if (t->HasTerms ())
        {
          CHECK_GE (pb.terms ().capacity (), 0)
              << "Teller " << t->GetAddress () << " has negative capacity";
          CHECK_GE (pb.next_price (), 0)
              << "Teller " << t->GetAddress () << " has negative price";
        }
    }
}

/**
 * Verifies that all bonds belong to existing tellers and are not fully
 * claimed yet.
 */
void
ValidateBonds (Database& db)
{
  BondsTable bondsTbl(db);
  TellersTable tellers(db);

  auto res = bondsTbl.QueryAll ();
  while (res.Step ())
    {
      auto b = bondsTbl.GetFromResult (res);

      auto t = tellers.GetByAddress (b->GetTeller ());
      CHECK (t != nullptr)
          << "Bond " << b->GetId ()
          << " of non-existing teller " << b->GetTeller ();
      CHECK_LE (static_cast<int64_t> (b->GetId ()),
                t->GetProto ().num_bonds ())
          << "Bond " << b->GetId () << " of " << b->GetTeller ()
          << " has an ID that was not yet issued";

      CHECK_GE (b->GetClaimed (), 0);
      CHECK_LT (b->GetClaimed (), b->GetPayout ())
          << "Bond " << b->GetId () << " of " << b->GetTeller ()
          << " is fully claimed but still exists";
    }
}

/**
 * Verifies that each lock vault holds at least the amount of all locks
 * in it.
 */
void
ValidateLocks (Database& db)
{
  std::map<std::pair<std::string, std::string>, Amount> locked;
  {
    LocksTable locks(db);
    auto res = locks.QueryAll ();
    while (res.Step ())
      {
        auto l = locks.GetFromResult (res);
        CHECK_GT (l->GetAmount (), 0) << "Lock " << l->GetId () << " is empty";
        locked[std::make_pair (l->GetVault (), l->GetAsset ())]
            += l->GetAmount ();
      }
  }

  Balances balances(db);
  for (const auto& entry : locked)
    CHECK_GE (balances.Get (entry.first.first, entry.first.second),
              entry.second)
        << "Vault " << entry.first.first
        << " holds less " << entry.first.second << " than is locked";
}

} // anonymous namespace

void
BondsLogic::ValidateStateSlow (Database& db, const Context& ctx)
{
  LOG (INFO) << "Performing slow validation of the game-state database...";
  ValidateSupply (db);
  ValidateTellers (db);
  ValidateBonds (db);
  ValidateLocks (db);
}

} // namespace bonds
