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

#include "asset.hpp"

#include <glog/logging.h>

namespace bonds
{

Asset::Asset (Database& d, const std::string& n)
  : db(d), name(n), isNew(true)
{
  VLOG (1) << "Created instance for new asset " << name;
  data.SetToDefault ();
}

Asset::Asset (Database& d, const Database::Result<AssetResult>& res)
  : db(d), isNew(false)
{
  name = res.Get<AssetResult::name> ();
  data = res.GetProto<AssetResult::proto> ();

  VLOG (2) << "Created asset instance for " << name << " from database";
}

Asset::~Asset ()
{
  if (!isNew && !data.IsDirty ())
    {
      VLOG (2) << "Asset instance " << name << " is not dirty";
      return;
    }

  VLOG (1) << "Updating asset " << name << " in the database";

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `assets`
      (`name`, `proto`)
      VALUES (?1, ?2)
  )");

  stmt.Bind (1, name);
  stmt.BindProto (2, data);

  stmt.Execute ();
}

AssetsTable::Handle
AssetsTable::CreateNew (const std::string& name)
{
  CHECK (GetByName (name) == nullptr)
      << "Asset " << name << " exists already";
  return Handle (new Asset (db, name));
}

AssetsTable::Handle
AssetsTable::GetFromResult (const Database::Result<AssetResult>& res)
{
  return Handle (new Asset (db, res));
}

AssetsTable::Handle
AssetsTable::GetByName (const std::string& name)
{
  auto stmt = db.Prepare ("SELECT * FROM `assets` WHERE `name` = ?1");
  stmt.Bind (1, name);
  auto res = stmt.Query<AssetResult> ();

  if (!res.Step ())
    return nullptr;

  auto r = GetFromResult (res);
  CHECK (!res.Step ());
  return r;
}

Database::Result<AssetResult>
AssetsTable::QueryAll ()
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `assets`
      ORDER BY `name`
  )");
  return stmt.Query<AssetResult> ();
}

namespace
{

struct MinterResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, minter, 1);
};

} // anonymous namespace

bool
AssetsTable::IsMinter (const std::string& asset, const std::string& minter)
{
  auto stmt = db.Prepare (R"(
    SELECT `minter`
      FROM `asset_minters`
      WHERE `asset` = ?1 AND `minter` = ?2
  )");
  stmt.Bind (1, asset);
  stmt.Bind (2, minter);

  auto res = stmt.Query<MinterResult> ();
  return res.Step ();
}

void
AssetsTable::AddMinter (const std::string& asset, const std::string& minter)
{
  VLOG (1) << "Adding " << minter << " as minter of " << asset;

  auto stmt = db.Prepare (R"(
    INSERT OR IGNORE INTO `asset_minters`
      (`asset`, `minter`)
      VALUES (?1, ?2)
  )");
  stmt.Bind (1, asset);
  stmt.Bind (2, minter);
  stmt.Execute ();
}

void
AssetsTable::RemoveMinter (const std::string& asset, const std::string& minter)
{
  VLOG (1) << "Removing " << minter << " as minter of " << asset;

  auto stmt = db.Prepare (R"(
    DELETE FROM `asset_minters`
      WHERE `asset` = ?1 AND `minter` = ?2
  )");
  stmt.Bind (1, asset);
  stmt.Bind (2, minter);
  stmt.Execute ();
}

std::vector<std::string>
AssetsTable::GetMinters (const std::string& asset)
{
  auto stmt = db.Prepare (R"(
    SELECT `minter`
      FROM `asset_minters`
      WHERE `asset` = ?1
      ORDER BY `minter`
  )");
  stmt.Bind (1, asset);

  std::vector<std::string> res;
  auto rows = stmt.Query<MinterResult> ();
  while (rows.Step ())
    res.push_back (rows.Get<MinterResult::minter> ());

  return res;
}

} // namespace bonds
