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

#include "lock.hpp"

#include <glog/logging.h>

namespace bonds
{

Lock::Lock (Database& d)
  : db(d), id(db.GetNextId ()), amount(0), end(0),
    isNew(true), deleted(false)
{
  VLOG (1) << "Created new lock with ID " << id;
}

Lock::Lock (Database& d, const Database::Result<LockResult>& res)
  : db(d), isNew(false), deleted(false)
{
  id = res.Get<LockResult::id> ();
  vault = res.Get<LockResult::vault> ();
  owner = res.Get<LockResult::owner> ();
  asset = res.Get<LockResult::asset> ();
  amount = res.Get<LockResult::amount> ();
  end = res.Get<LockResult::end> ();
}

Lock::~Lock ()
{
  if (isNew && deleted)
    {
      VLOG (1) << "Not inserting immediately deleted lock " << id;
      return;
    }

  if (deleted)
    {
      VLOG (1) << "Deleting lock " << id;
      auto stmt = db.Prepare (R"(
        DELETE FROM `locks`
          WHERE `id` = ?1
      )");
      stmt.Bind (1, id);
      stmt.Execute ();
      return;
    }

  if (!isNew)
    return;

  VLOG (1) << "Inserting new lock " << id << " into the database";
  CHECK_NE (vault, "") << "No vault set for lock " << id;
  CHECK_NE (owner, "") << "No owner set for lock " << id;
  CHECK_GT (amount, 0) << "No amount set for lock " << id;

  auto stmt = db.Prepare (R"(
    INSERT INTO `locks`
      (`id`, `vault`, `owner`, `asset`, `amount`, `end`)
      VALUES (?1, ?2, ?3, ?4, ?5, ?6)
  )");
  stmt.Bind (1, id);
  stmt.Bind (2, vault);
  stmt.Bind (3, owner);
  stmt.Bind (4, asset);
  stmt.Bind (5, amount);
  stmt.Bind (6, end);
  stmt.Execute ();
}

void
Lock::Delete ()
{
  deleted = true;
}

LocksTable::Handle
LocksTable::CreateNew (const std::string& vault, const std::string& owner,
                       const std::string& asset, const Amount amount,
                       const int64_t end)
{
  Handle l(new Lock (db));

  l->vault = vault;
  l->owner = owner;
  l->asset = asset;
  l->amount = amount;
  l->end = end;

  return l;
}

LocksTable::Handle
LocksTable::GetFromResult (const Database::Result<LockResult>& res)
{
  return Handle (new Lock (db, res));
}

LocksTable::Handle
LocksTable::GetById (const Database::IdT id)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `locks`
      WHERE `id` = ?1
  )");
  stmt.Bind (1, id);
  auto res = stmt.Query<LockResult> ();
  if (!res.Step ())
    return nullptr;

  auto l = GetFromResult (res);
  CHECK (!res.Step ());
  return l;
}

Database::Result<LockResult>
LocksTable::QueryAll ()
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `locks`
      ORDER BY `id`
  )");
  return stmt.Query<LockResult> ();
}

Database::Result<LockResult>
LocksTable::QueryForOwner (const std::string& owner)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `locks`
      WHERE `owner` = ?1
      ORDER BY `id`
  )");
  stmt.Bind (1, owner);
  return stmt.Query<LockResult> ();
}

} // namespace bonds
