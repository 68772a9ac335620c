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

#ifndef DATABASE_BOND_HPP
#define DATABASE_BOND_HPP

#include "amount.hpp"
#include "database.hpp"

#include <memory>
#include <string>

namespace bonds
{

/**
 * Database result type for rows from the bonds table.
 */
struct BondResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, teller, 1);
  RESULT_COLUMN (int64_t, id, 2);
  RESULT_COLUMN (std::string, owner, 3);
  RESULT_COLUMN (std::string, approved, 4);
  RESULT_COLUMN (int64_t, principal_paid, 5);
  RESULT_COLUMN (int64_t, payout, 6);
  RESULT_COLUMN (int64_t, claimed, 7);
  RESULT_COLUMN (int64_t, vesting_start, 8);
  RESULT_COLUMN (int64_t, vesting_term, 9);
};

/**
 * Wrapper class around a bond in the database.  Instances should be
 * obtained through BondsTable.  The principal, payout and vesting schedule
 * are immutable; only ownership, the approved delegate and the claimed
 * amount change.  A bond that is fully claimed gets deleted from the
 * database when the instance is destructed.
 */
class Bond
{

private:

  /** Database reference this belongs to.  */
  Database& db;

  /** The teller that sold this bond.  */
  std::string teller;

  /** The bond's ID within the teller.  */
  Database::IdT id;

  /** Current owner.  */
  std::string owner;

  /** Approved delegate (empty if none).  */
  std::string approved;

  /** Principal paid for the bond.  */
  Amount principalPaid;

  /** Total payout of the bond.  */
  Amount payout;

  /** Payout already claimed.  */
  Amount claimed;

  /** Timestamp at which vesting started.  */
  int64_t vestingStart;

  /** Duration of the vesting.  */
  int64_t vestingTerm;

  /** Whether or not this is a new instance.  */
  bool isNew;

  /** Whether or not this is an existing but dirty instance.  */
  bool dirty;

  explicit Bond (Database& d, const std::string& t, Database::IdT i);
  explicit Bond (Database& d, const Database::Result<BondResult>& res);

  friend class BondsTable;

public:

  /**
   * In the destructor, the underlying database is updated if there are any
   * modifications to send.
   */
  ~Bond ();

  Bond () = delete;
  Bond (const Bond&) = delete;
  void operator= (const Bond&) = delete;

  const std::string&
  GetTeller () const
  {
    return teller;
  }

  Database::IdT
  GetId () const
  {
    return id;
  }

  const std::string&
  GetOwner () const
  {
    return owner;
  }

  const std::string&
  GetApproved () const
  {
    return approved;
  }

  Amount
  GetPrincipalPaid () const
  {
    return principalPaid;
  }

  Amount
  GetPayout () const
  {
    return payout;
  }

  Amount
  GetClaimed () const
  {
    return claimed;
  }

  int64_t
  GetVestingStart () const
  {
    return vestingStart;
  }

  int64_t
  GetVestingTerm () const
  {
    return vestingTerm;
  }

  /**
   * Returns true if the full payout has been claimed, which means
   * the bond will be deleted.
   */
  bool
  IsRedeemed () const
  {
    return claimed == payout;
  }

  /**
   * Changes the owner.  This clears the approved delegate.
   */
  void SetOwner (const std::string& o);

  /**
   * Sets the approved delegate (or clears it with an empty string).
   */
  void SetApproved (const std::string& a);

  /**
   * Increases the claimed amount.  It must not exceed the payout.
   */
  void AddClaimed (Amount val);

};

/**
 * Utility class that handles querying the bonds table and the bond
 * operator approvals.
 */
class BondsTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Movable handle to a bond instance.  */
  using Handle = std::unique_ptr<Bond>;

  explicit BondsTable (Database& d)
    : db(d)
  {}

  BondsTable () = delete;
  BondsTable (const BondsTable&) = delete;
  void operator= (const BondsTable&) = delete;

  /**
   * Creates a new bond with the given data.
   */
  Handle CreateNew (const std::string& teller, Database::IdT id,
                    const std::string& owner,
                    Amount principalPaid, Amount payout,
                    int64_t vestingStart, int64_t vestingTerm);

  Handle GetFromResult (const Database::Result<BondResult>& res);

  /**
   * Returns the bond with the given ID or null if it does not exist
   * (e.g. because it has been redeemed already).
   */
  Handle GetById (const std::string& teller, Database::IdT id);

  /**
   * Queries for all bonds, ordered by teller and ID.
   */
  Database::Result<BondResult> QueryAll ();

  /**
   * Queries for all bonds of a given owner.
   */
  Database::Result<BondResult> QueryForOwner (const std::string& owner);

  /**
   * Queries for all bonds of a teller.
   */
  Database::Result<BondResult> QueryForTeller (const std::string& teller);

  /**
   * Returns true if op is approved as operator for all of owner's bonds
   * on the given teller.
   */
  bool IsOperator (const std::string& teller, const std::string& owner,
                   const std::string& op);

  /**
   * Sets or clears the operator approval.
   */
  void SetOperator (const std::string& teller, const std::string& owner,
                    const std::string& op, bool approved);

};

} // namespace bonds

#endif // DATABASE_BOND_HPP
