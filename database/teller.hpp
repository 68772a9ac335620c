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

#ifndef DATABASE_TELLER_HPP
#define DATABASE_TELLER_HPP

#include "database.hpp"
#include "lazyproto.hpp"

#include "proto/teller.pb.h"

#include <memory>
#include <string>

namespace bonds
{

/**
 * Database result type for rows from the tellers table.
 */
struct TellerResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, address, 1);
  RESULT_COLUMN (std::string, depository, 2);
  RESULT_COLUMN (bonds::proto::Teller, proto, 3);
};

/**
 * Wrapper class around the stored state of one bond teller (configuration,
 * terms, price anchor and flags).  The logic operating on it is in
 * BondTeller; this class is just the database row.
 */
class Teller
{

private:

  /** Database reference this belongs to.  */
  Database& db;

  /** The address of the teller.  */
  std::string address;

  /** The depository that created it.  */
  std::string depository;

  /** The stored state.  */
  LazyProto<proto::Teller> data;

  /** Whether or not this is a new instance.  */
  bool isNew;

  explicit Teller (Database& d, const std::string& a, const std::string& depo);
  explicit Teller (Database& d, const Database::Result<TellerResult>& res);

  friend class TellersTable;

public:

  /**
   * In the destructor, the underlying database is updated if there are any
   * modifications to send.
   */
  ~Teller ();

  Teller () = delete;
  Teller (const Teller&) = delete;
  void operator= (const Teller&) = delete;

  const std::string&
  GetAddress () const
  {
    return address;
  }

  const std::string&
  GetDepository () const
  {
    return depository;
  }

  const proto::Teller&
  GetProto () const
  {
    return data.Get ();
  }

  proto::Teller&
  MutableProto ()
  {
    return data.Mutable ();
  }

  /**
   * Returns true if terms have been set for the teller.
   */
  bool
  HasTerms () const
  {
    return data.Get ().has_terms ();
  }

};

/**
 * Utility class that handles querying the tellers table.
 */
class TellersTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Movable handle to a teller instance.  */
  using Handle = std::unique_ptr<Teller>;

  explicit TellersTable (Database& d)
    : db(d)
  {}

  TellersTable () = delete;
  TellersTable (const TellersTable&) = delete;
  void operator= (const TellersTable&) = delete;

  /**
   * Creates a new teller at the given address.  The address must not be
   * used yet.
   */
  Handle CreateNew (const std::string& address, const std::string& depository);

  Handle GetFromResult (const Database::Result<TellerResult>& res);

  /**
   * Returns the teller with the given address or null.
   */
  Handle GetByAddress (const std::string& address);

  /**
   * Returns the native teller whose receiver address is the given Xaya
   * address, or null if there is none.
   */
  Handle GetByReceiver (const std::string& receiver);

  /**
   * Queries for all tellers ordered by address.
   */
  Database::Result<TellerResult> QueryAll ();

  /**
   * Queries for all tellers created by a given depository.
   */
  Database::Result<TellerResult> QueryForDepository (
      const std::string& depository);

};

} // namespace bonds

#endif // DATABASE_TELLER_HPP
