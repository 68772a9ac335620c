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

#include "teller.hpp"

#include <glog/logging.h>

namespace bonds
{

Teller::Teller (Database& d, const std::string& a, const std::string& depo)
  : db(d), address(a), depository(depo), isNew(true)
{
  VLOG (1) << "Created instance for new teller " << address;
  data.SetToDefault ();
}

Teller::Teller (Database& d, const Database::Result<TellerResult>& res)
  : db(d), isNew(false)
{
  address = res.Get<TellerResult::address> ();
  depository = res.Get<TellerResult::depository> ();
  data = res.GetProto<TellerResult::proto> ();

  VLOG (2) << "Created teller instance for " << address << " from database";
}

Teller::~Teller ()
{
  if (!isNew && !data.IsDirty ())
    {
      VLOG (2) << "Teller " << address << " is not dirty";
      return;
    }

  VLOG (1) << "Updating teller " << address << " in the database";

  const auto& cfg = data.Get ().config ();
  if (data.Get ().has_terms ())
    {
      const auto& terms = data.Get ().terms ();
      CHECK_GE (terms.capacity (), 0)
          << "Negative capacity for teller " << address;
      CHECK_NE (terms.price_adj_denom (), 0);
      CHECK_GT (terms.half_life (), 0);
    }
  CHECK_LE (data.Get ().protocol_fee_bps (), 10000);

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `tellers`
      (`address`, `depository`, `receiver`, `proto`)
      VALUES (?1, ?2, ?3, ?4)
  )");

  stmt.Bind (1, address);
  stmt.Bind (2, depository);
  if (cfg.kind () == proto::TellerConfig::NATIVE)
    {
      CHECK_NE (cfg.receiver (), "")
          << "Native teller " << address << " has no receiver";
      stmt.Bind (3, cfg.receiver ());
    }
  else
    stmt.BindNull (3);
  stmt.BindProto (4, data);

  stmt.Execute ();
}

TellersTable::Handle
TellersTable::CreateNew (const std::string& address,
                         const std::string& depository)
{
  CHECK (GetByAddress (address) == nullptr)
      << "Teller " << address << " exists already";
  return Handle (new Teller (db, address, depository));
}

TellersTable::Handle
TellersTable::GetFromResult (const Database::Result<TellerResult>& res)
{
  return Handle (new Teller (db, res));
}

TellersTable::Handle
TellersTable::GetByAddress (const std::string& address)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `tellers`
      WHERE `address` = ?1
  )");
  stmt.Bind (1, address);
  auto res = stmt.Query<TellerResult> ();

  if (!res.Step ())
    return nullptr;

  auto r = GetFromResult (res);
  CHECK (!res.Step ());
  return r;
}

TellersTable::Handle
TellersTable::GetByReceiver (const std::string& receiver)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `tellers`
      WHERE `receiver` = ?1
  )");
  stmt.Bind (1, receiver);
  auto res = stmt.Query<TellerResult> ();

  if (!res.Step ())
    return nullptr;

  auto r = GetFromResult (res);
  CHECK (!res.Step ());
  return r;
}

Database::Result<TellerResult>
TellersTable::QueryAll ()
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `tellers`
      ORDER BY `address`
  )");
  return stmt.Query<TellerResult> ();
}

Database::Result<TellerResult>
TellersTable::QueryForDepository (const std::string& depository)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `tellers`
      WHERE `depository` = ?1
      ORDER BY `address`
  )");
  stmt.Bind (1, depository);
  return stmt.Query<TellerResult> ();
}

} // namespace bonds
