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

#include "depository.hpp"

#include <glog/logging.h>

namespace bonds
{

Depository::Depository (Database& d, const std::string& a)
  : db(d), address(a), isNew(true)
{
  VLOG (1) << "Created instance for new depository " << address;
  data.SetToDefault ();
}

Depository::Depository (Database& d,
                        const Database::Result<DepositoryResult>& res)
  : db(d), isNew(false)
{
  address = res.Get<DepositoryResult::address> ();
  data = res.GetProto<DepositoryResult::proto> ();
}

Depository::~Depository ()
{
  if (!isNew && !data.IsDirty ())
    return;

  VLOG (1) << "Updating depository " << address << " in the database";

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `depositories`
      (`address`, `proto`)
      VALUES (?1, ?2)
  )");
  stmt.Bind (1, address);
  stmt.BindProto (2, data);
  stmt.Execute ();
}

namespace
{

struct DepositoryTellerResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, teller, 1);
};

} // anonymous namespace

bool
Depository::HasTeller (const std::string& teller) const
{
  auto stmt = db.Prepare (R"(
    SELECT `teller`
      FROM `depository_tellers`
      WHERE `depository` = ?1 AND `teller` = ?2
  )");
  stmt.Bind (1, address);
  stmt.Bind (2, teller);

  auto res = stmt.Query<DepositoryTellerResult> ();
  return res.Step ();
}

bool
Depository::AddTeller (const std::string& teller)
{
  if (HasTeller (teller))
    return false;

  VLOG (1) << "Adding teller " << teller << " to depository " << address;
  auto stmt = db.Prepare (R"(
    INSERT INTO `depository_tellers`
      (`depository`, `teller`)
      VALUES (?1, ?2)
  )");
  stmt.Bind (1, address);
  stmt.Bind (2, teller);
  stmt.Execute ();

  return true;
}

bool
Depository::RemoveTeller (const std::string& teller)
{
  if (!HasTeller (teller))
    return false;

  VLOG (1) << "Removing teller " << teller << " from depository " << address;
  auto stmt = db.Prepare (R"(
    DELETE FROM `depository_tellers`
      WHERE `depository` = ?1 AND `teller` = ?2
  )");
  stmt.Bind (1, address);
  stmt.Bind (2, teller);
  stmt.Execute ();

  return true;
}

std::vector<std::string>
Depository::GetTellers () const
{
  auto stmt = db.Prepare (R"(
    SELECT `teller`
      FROM `depository_tellers`
      WHERE `depository` = ?1
      ORDER BY `teller`
  )");
  stmt.Bind (1, address);

  std::vector<std::string> res;
  auto rows = stmt.Query<DepositoryTellerResult> ();
  while (rows.Step ())
    res.push_back (rows.Get<DepositoryTellerResult::teller> ());

  return res;
}

DepositoriesTable::Handle
DepositoriesTable::CreateNew (const std::string& address)
{
  CHECK (GetByAddress (address) == nullptr)
      << "Depository " << address << " exists already";
  return Handle (new Depository (db, address));
}

DepositoriesTable::Handle
DepositoriesTable::GetFromResult (const Database::Result<DepositoryResult>& res)
{
  return Handle (new Depository (db, res));
}

DepositoriesTable::Handle
DepositoriesTable::GetByAddress (const std::string& address)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `depositories`
      WHERE `address` = ?1
  )");
  stmt.Bind (1, address);
  auto res = stmt.Query<DepositoryResult> ();

  if (!res.Step ())
    return nullptr;

  auto r = GetFromResult (res);
  CHECK (!res.Step ());
  return r;
}

Database::Result<DepositoryResult>
DepositoriesTable::QueryAll ()
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `depositories`
      ORDER BY `address`
  )");
  return stmt.Query<DepositoryResult> ();
}

} // namespace bonds
