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

#ifndef DATABASE_LOCK_HPP
#define DATABASE_LOCK_HPP

#include "amount.hpp"
#include "database.hpp"

#include <memory>
#include <string>

namespace bonds
{

/**
 * Database result type for rows from the locks table.
 */
struct LockResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, id, 1);
  RESULT_COLUMN (std::string, vault, 2);
  RESULT_COLUMN (std::string, owner, 3);
  RESULT_COLUMN (std::string, asset, 4);
  RESULT_COLUMN (int64_t, amount, 5);
  RESULT_COLUMN (int64_t, end, 6);
};

/**
 * Wrapper class around a time-locked position held by a lock vault.
 * Locks are immutable once created; they can only be deleted when
 * withdrawn.
 */
class Lock
{

private:

  /** Database reference this belongs to.  */
  Database& db;

  /** The lock's ID.  */
  Database::IdT id;

  /** The vault holding the lock.  */
  std::string vault;

  /** The owner who can withdraw it.  */
  std::string owner;

  /** The locked asset.  */
  std::string asset;

  /** The locked amount.  */
  Amount amount;

  /** Timestamp when the lock ends.  */
  int64_t end;

  /** Whether or not this is a new instance.  */
  bool isNew;

  /** Set if the lock should be deleted.  */
  bool deleted;

  explicit Lock (Database& d);
  explicit Lock (Database& d, const Database::Result<LockResult>& res);

  friend class LocksTable;

public:

  /**
   * In the destructor, the lock is inserted if it is new or removed
   * if it has been deleted.
   */
  ~Lock ();

  Lock () = delete;
  Lock (const Lock&) = delete;
  void operator= (const Lock&) = delete;

  Database::IdT
  GetId () const
  {
    return id;
  }

  const std::string&
  GetVault () const
  {
    return vault;
  }

  const std::string&
  GetOwner () const
  {
    return owner;
  }

  const std::string&
  GetAsset () const
  {
    return asset;
  }

  Amount
  GetAmount () const
  {
    return amount;
  }

  int64_t
  GetEnd () const
  {
    return end;
  }

  /**
   * Marks the lock for deletion.
   */
  void Delete ();

};

/**
 * Utility class that handles querying the locks table.
 */
class LocksTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Movable handle to a lock instance.  */
  using Handle = std::unique_ptr<Lock>;

  explicit LocksTable (Database& d)
    : db(d)
  {}

  LocksTable () = delete;
  LocksTable (const LocksTable&) = delete;
  void operator= (const LocksTable&) = delete;

  /**
   * Creates a new lock with an auto-generated ID.
   */
  Handle CreateNew (const std::string& vault, const std::string& owner,
                    const std::string& asset, Amount amount, int64_t end);

  Handle GetFromResult (const Database::Result<LockResult>& res);

  /**
   * Returns the lock with the given ID or null.
   */
  Handle GetById (Database::IdT id);

  /**
   * Queries for all locks ordered by ID.
   */
  Database::Result<LockResult> QueryAll ();

  /**
   * Queries for the locks of an owner ordered by ID.
   */
  Database::Result<LockResult> QueryForOwner (const std::string& owner);

};

} // namespace bonds

#endif // DATABASE_LOCK_HPP
