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

#include "gamestatejson.hpp"

#include "jsonutils.hpp"

#include "database/balances.hpp"
#include "database/eventlog.hpp"
#include "database/moneysupply.hpp"
#include "proto/teller.pb.h"

#include <glog/logging.h>

#include <algorithm>

namespace bonds
{

namespace
{

/**
 * Converts a governance record to JSON.  The pending governor is only
 * included if there is one.
 */
Json::Value
GovernanceToJson (const proto::Governance& gov)
{
  Json::Value res(Json::objectValue);
  res["current"] = gov.current ();
  if (!gov.pending ().empty ())
    res["pending"] = gov.pending ();
  return res;
}

/**
 * Converts the sale terms of a teller to JSON, using the same field
 * names as the "terms" move.
 */
Json::Value
TermsToJson (const proto::TellerTerms& terms)
{
  Json::Value res(Json::objectValue);
  res["startprice"] = IntToJson (terms.start_price ());
  res["minimumprice"] = IntToJson (terms.minimum_price ());
  res["maxpayout"] = IntToJson (terms.max_payout ());
  res["priceadjnum"] = IntToJson (terms.price_adj_num ());
  res["priceadjdenom"] = IntToJson (terms.price_adj_denom ());
  res["capacity"] = IntToJson (terms.capacity ());
  res["capacityispayout"] = terms.capacity_is_payout ();
  res["starttime"] = IntToJson (terms.start_time ());
  res["endtime"] = IntToJson (terms.end_time ());
  res["vestingterm"] = IntToJson (terms.global_vesting_term ());
  res["halflife"] = IntToJson (terms.half_life ());
  return res;
}

} // anonymous namespace

template <>
  Json::Value
  GameStateJson::Convert<Asset> (const Asset& a) const
{
  const auto& pb = a.GetProto ();

  Json::Value res(Json::objectValue);
  res["name"] = a.GetName ();
  res["governance"] = GovernanceToJson (pb.governance ());
  res["permit"] = pb.permit ();
  res["native"] = pb.native ();

  Json::Value minters(Json::arrayValue);
  for (const auto& m : assets.GetMinters (a.GetName ()))
    minters.append (m);
  res["minters"] = minters;

  res["supply"] = IntToJson (MoneySupply (db).Get (a.GetName ()));

  return res;
}

template <>
  Json::Value
  GameStateJson::Convert<Depository> (const Depository& d) const
{
  const auto& pb = d.GetProto ();

  Json::Value res(Json::objectValue);
  res["address"] = d.GetAddress ();
  res["governance"] = GovernanceToJson (pb.governance ());
  res["reward"] = pb.reward ();
  res["lockvault"] = pb.lock_vault ();
  res["pool"] = pb.pool ();
  res["dao"] = pb.dao ();
  res["nonce"] = IntToJson (pb.nonce ());

  Json::Value tellers(Json::arrayValue);
  for (const auto& t : d.GetTellers ())
    tellers.append (t);
  res["tellers"] = tellers;

  return res;
}

template <>
  Json::Value
  GameStateJson::Convert<Teller> (const Teller& t) const
{
  const auto& pb = t.GetProto ();
  const auto& cfg = pb.config ();

  Json::Value res(Json::objectValue);
  res["address"] = t.GetAddress ();
  res["depository"] = t.GetDepository ();
  res["name"] = cfg.name ();
  res["principal"] = cfg.principal ();
  res["permittable"] = cfg.permittable ();

  switch (cfg.kind ())
    {
    case proto::TellerConfig::ERC20:
      res["kind"] = "erc20";
      break;
    case proto::TellerConfig::NATIVE:
      res["kind"] = "native";
      res["receiver"] = cfg.receiver ();
      break;
    default:
      LOG (FATAL)
          << "Invalid kind " << static_cast<int> (cfg.kind ())
          << " for teller " << t.GetAddress ();
    }

  res["reward"] = cfg.reward ();
  res["lockvault"] = cfg.lock_vault ();
  res["pool"] = cfg.pool ();
  res["dao"] = cfg.dao ();

  res["governance"] = GovernanceToJson (pb.governance ());
  res["paused"] = pb.paused ();
  res["protocolfee"] = IntToJson (pb.protocol_fee_bps ());
  res["numbonds"] = IntToJson (pb.num_bonds ());

  if (t.HasTerms ())
    {
      res["terms"] = TermsToJson (pb.terms ());
      res["nextprice"] = IntToJson (pb.next_price ());
      res["lastpriceupdate"] = IntToJson (pb.last_price_update ());
    }

  return res;
}

template <>
  Json::Value
  GameStateJson::Convert<Bond> (const Bond& b) const
{
  Json::Value res(Json::objectValue);
  res["teller"] = b.GetTeller ();
  res["id"] = IntToJson (b.GetId ());
  res["owner"] = b.GetOwner ();
  if (!b.GetApproved ().empty ())
    res["approved"] = b.GetApproved ();

  res["principal"] = IntToJson (b.GetPrincipalPaid ());
  res["payout"] = IntToJson (b.GetPayout ());
  res["claimed"] = IntToJson (b.GetClaimed ());

  Json::Value vesting(Json::objectValue);
  vesting["start"] = IntToJson (b.GetVestingStart ());
  vesting["term"] = IntToJson (b.GetVestingTerm ());
  res["vesting"] = vesting;

  return res;
}

template <>
  Json::Value
  GameStateJson::Convert<Lock> (const Lock& l) const
{
  Json::Value res(Json::objectValue);
  res["id"] = IntToJson (l.GetId ());
  res["vault"] = l.GetVault ();
  res["owner"] = l.GetOwner ();
  res["asset"] = l.GetAsset ();
  res["amount"] = IntToJson (l.GetAmount ());
  res["end"] = IntToJson (l.GetEnd ());

  return res;
}

template <typename T, typename R>
  Json::Value
  GameStateJson::ResultsAsArray (T& tbl, Database::Result<R> res) const
{
  Json::Value arr(Json::arrayValue);

  while (res.Step ())
    {
      const auto h = tbl.GetFromResult (res);
      arr.append (Convert (*h));
    }

  return arr;
}

Json::Value
GameStateJson::Assets ()
{
  return ResultsAsArray (assets, assets.QueryAll ());
}

Json::Value
GameStateJson::Balances ()
{
  bonds::Balances tbl(db);

  Json::Value res(Json::objectValue);
  auto q = tbl.QueryAll ();
  while (q.Step ())
    {
      const auto amount = q.Get<BalanceResult::amount> ();
      if (amount == 0)
        continue;
      res[q.Get<BalanceResult::account> ()][q.Get<BalanceResult::asset> ()]
          = IntToJson (amount);
    }

  return res;
}

Json::Value
GameStateJson::Balances (const std::string& account)
{
  bonds::Balances tbl(db);

  Json::Value res(Json::objectValue);
  auto q = tbl.QueryForAccount (account);
  while (q.Step ())
    {
      const auto amount = q.Get<BalanceResult::amount> ();
      if (amount != 0)
        res[q.Get<BalanceResult::asset> ()] = IntToJson (amount);
    }

  return res;
}

Json::Value
GameStateJson::Allowances ()
{
  bonds::Balances tbl(db);

  Json::Value res(Json::arrayValue);
  auto q = tbl.QueryAllowances ();
  while (q.Step ())
    {
      const auto amount = q.Get<AllowanceResult::amount> ();
      if (amount == 0)
        continue;

      Json::Value cur(Json::objectValue);
      cur["owner"] = q.Get<AllowanceResult::owner> ();
      cur["spender"] = q.Get<AllowanceResult::spender> ();
      cur["asset"] = q.Get<AllowanceResult::asset> ();
      cur["amount"] = IntToJson (amount);
      res.append (cur);
    }

  return res;
}

Json::Value
GameStateJson::Depositories ()
{
  DepositoriesTable tbl(db);
  return ResultsAsArray (tbl, tbl.QueryAll ());
}

Json::Value
GameStateJson::Tellers ()
{
  TellersTable tbl(db);
  return ResultsAsArray (tbl, tbl.QueryAll ());
}

Json::Value
GameStateJson::Bonds ()
{
  BondsTable tbl(db);
  return ResultsAsArray (tbl, tbl.QueryAll ());
}

Json::Value
GameStateJson::Bonds (const std::string& owner)
{
  BondsTable tbl(db);
  return ResultsAsArray (tbl, tbl.QueryForOwner (owner));
}

Json::Value
GameStateJson::Locks ()
{
  LocksTable tbl(db);
  return ResultsAsArray (tbl, tbl.QueryAll ());
}

Json::Value
GameStateJson::Locks (const std::string& owner)
{
  LocksTable tbl(db);
  return ResultsAsArray (tbl, tbl.QueryForOwner (owner));
}

Json::Value
GameStateJson::Events (const std::string& emitter, const unsigned limit)
{
  const unsigned maxEvents = ctx.RoConfig ()->params ().max_events ();
  const unsigned n = std::min (limit, maxEvents);

  /* The height passed here is irrelevant, as we only read.  */
  EventLog log(db, 0);
  auto q = emitter.empty ()
              ? log.QueryRecent (n)
              : log.QueryForEmitter (emitter, n);

  Json::Value res(Json::arrayValue);
  while (q.Step ())
    {
      Json::Value cur(Json::objectValue);
      cur["id"] = IntToJson (q.Get<EventResult::id> ());
      cur["height"] = IntToJson (q.Get<EventResult::height> ());
      cur["emitter"] = q.Get<EventResult::emitter> ();
      cur["type"] = q.Get<EventResult::type> ();
      cur["args"] = EventLog::GetArgs (q);
      res.append (cur);
    }

  return res;
}

Json::Value
GameStateJson::FullState ()
{
  Json::Value res(Json::objectValue);

  res["assets"] = Assets ();
  res["balances"] = Balances ();
  res["allowances"] = Allowances ();
  res["depositories"] = Depositories ();
  res["tellers"] = Tellers ();
  res["bonds"] = Bonds ();
  res["locks"] = Locks ();

  return res;
}

} // namespace bonds
