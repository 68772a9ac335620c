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

#ifndef DATABASE_DEPOSITORY_HPP
#define DATABASE_DEPOSITORY_HPP

#include "database.hpp"
#include "lazyproto.hpp"

#include "proto/depository.pb.h"

#include <memory>
#include <string>
#include <vector>

namespace bonds
{

/**
 * Database result type for rows from the depositories table.
 */
struct DepositoryResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, address, 1);
  RESULT_COLUMN (bonds::proto::Depository, proto, 2);
};

/**
 * Wrapper class around the state of one bond depository.  Instances
 * should be obtained through the DepositoriesTable.
 */
class Depository
{

private:

  /** Database reference this belongs to.  */
  Database& db;

  /** The address of this depository.  */
  std::string address;

  /** General proto data.  */
  LazyProto<proto::Depository> data;

  /** Whether or not this is a new instance.  */
  bool isNew;

  explicit Depository (Database& d, const std::string& a);
  explicit Depository (Database& d,
                       const Database::Result<DepositoryResult>& res);

  friend class DepositoriesTable;

public:

  /**
   * In the destructor, the underlying database is updated if there are any
   * modifications to send.
   */
  ~Depository ();

  Depository () = delete;
  Depository (const Depository&) = delete;
  void operator= (const Depository&) = delete;

  const std::string&
  GetAddress () const
  {
    return address;
  }

  const proto::Depository&
  GetProto () const
  {
    return data.Get ();
  }

  proto::Depository&
  MutableProto ()
  {
    return data.Mutable ();
  }

  /**
   * Returns true if the given teller is in the authorised set.
   */
  bool HasTeller (const std::string& teller) const;

  /**
   * Adds a teller to the authorised set.  Returns false if it was
   * already in the set.
   */
  bool AddTeller (const std::string& teller);

  /**
   * Removes a teller from the set.  Returns false if it was not in it.
   */
  bool RemoveTeller (const std::string& teller);

  /**
   * Returns all authorised tellers in alphabetical order.
   */
  std::vector<std::string> GetTellers () const;

};

/**
 * Utility class that handles querying the depositories table.
 */
class DepositoriesTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Movable handle to a depository instance.  */
  using Handle = std::unique_ptr<Depository>;

  explicit DepositoriesTable (Database& d)
    : db(d)
  {}

  DepositoriesTable () = delete;
  DepositoriesTable (const DepositoriesTable&) = delete;
  void operator= (const DepositoriesTable&) = delete;

  /**
   * Creates a new depository at the given address, which must not
   * exist yet.
   */
  Handle CreateNew (const std::string& address);

  Handle GetFromResult (const Database::Result<DepositoryResult>& res);

  /**
   * Returns the depository with the given address or null.
   */
  Handle GetByAddress (const std::string& address);

  /**
   * Queries for all depositories ordered by address.
   */
  Database::Result<DepositoryResult> QueryAll ();

};

} // namespace bonds

#endif // DATABASE_DEPOSITORY_HPP
