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

#ifndef BONDS_BONDTELLER_HPP
#define BONDS_BONDTELLER_HPP

#include "context.hpp"
#include "errors.hpp"
#include "ledger.hpp"

#include "database/amount.hpp"
#include "database/bond.hpp"
#include "database/database.hpp"
#include "database/eventlog.hpp"
#include "database/teller.hpp"
#include "proto/teller.pb.h"

#include <string>

namespace bonds
{

/**
 * The parameters of a deposit, as chosen by the depositor.
 */
struct DepositOptions
{

  /** The amount of principal to deposit.  */
  Amount amount = 0;

  /** Minimum payout below which the deposit fails.  */
  Amount minAmountOut = 0;

  /** Owner of the resulting bond or lock.  */
  std::string recipient;

  /** If true, the payout is locked in the vault instead of vesting.  */
  bool stake = false;

};

/**
 * Result of a successful deposit.
 */
struct DepositResult
{

  /** The reward amount bought.  */
  Amount payout = 0;

  /**
   * ID of the created bond (if not staked) or the created lock
   * (if staked).
   */
  Database::IdT id = 0;

};

/**
 * The logic of a bond teller.  All tellers share this implementation,
 * while the per-instance state (configuration, terms and price anchor)
 * is stored in the tellers table.
 *
 * The teller sells reward for principal at a decaying price, and keeps
 * the registry of bonds it has issued.  Deposits and claims are atomic:
 * when they fail, the database is left unchanged.
 */
class BondTeller
{

private:

  /** The teller's address.  */
  const std::string address;

  Database& db;
  const Context& ctx;
  Ledger& ledger;

  EventLog events;
  TellersTable tellers;

  /** Registry of issued bonds.  */
  BondsTable registry;

  /**
   * The shared deposit routine.  If pullWithAllowance is set, the principal
   * is taken from the depositor through an allowance to the teller.
   * Otherwise the depositor's balance is debited directly (which is used
   * for wrapped native payments).
   */
  ErrorCode DepositInternal (const std::string& depositor,
                             bool pullWithAllowance,
                             const DepositOptions& opt, DepositResult& res);

  ErrorCode ClaimPayoutInternal (const std::string& caller,
                                 Database::IdT bondId, Amount& claimed);

  /**
   * Returns true if the caller is allowed to claim or transfer the bond,
   * i.e. is its owner, approved delegate or an operator of its owner.
   */
  bool IsAuthorised (const Bond& b, const std::string& caller);

public:

  explicit BondTeller (Database& d, const Context& c, Ledger& l,
                       const std::string& addr);

  BondTeller () = delete;
  BondTeller (const BondTeller&) = delete;
  void operator= (const BondTeller&) = delete;

  const std::string&
  GetAddress () const
  {
    return address;
  }

  /* Administrative calls.  They require the caller to be the
     teller's governance.  */

  ErrorCode SetTerms (const std::string& caller,
                      const proto::TellerTerms& terms);
  ErrorCode SetFees (const std::string& caller, int64_t protocolFeeBps);
  ErrorCode SetPaused (const std::string& caller, bool paused);
  ErrorCode SetAddresses (const std::string& caller,
                          const std::string& reward,
                          const std::string& lockVault,
                          const std::string& pool, const std::string& dao);
  ErrorCode SetPendingGovernance (const std::string& caller,
                                  const std::string& pending);
  ErrorCode AcceptGovernance (const std::string& caller);

  /* Quotes at the context's timestamp.  The stake flag does not change
     the result, as the same fee applies to both paths.  */

  ErrorCode CurrentPrice (Amount& price);
  ErrorCode CalculateAmountOut (Amount amountIn, bool stake, Amount& payout);
  ErrorCode CalculateAmountIn (Amount amountOut, bool stake,
                               Amount& amountIn);

  /**
   * Deposits principal previously approved for the teller.
   */
  ErrorCode Deposit (const std::string& caller, const DepositOptions& opt,
                     DepositResult& res);

  /**
   * Deposits principal, granting the allowance through a permit first.
   */
  ErrorCode DepositSigned (const std::string& caller,
                           const DepositOptions& opt,
                           Amount permitAmount, int64_t deadline,
                           DepositResult& res);

  /**
   * Processes a native payment to the teller's receiver.  The paid amount
   * is wrapped into the principal for the sender first.  If the deposit
   * fails, the sender keeps the wrapped coins.
   */
  ErrorCode DepositNative (const std::string& sender,
                           const DepositOptions& opt, DepositResult& res);

  /**
   * Claims the vested part of a bond for the caller.  The claimed amount
   * is returned in "claimed".
   */
  ErrorCode ClaimPayout (const std::string& caller, Database::IdT bondId,
                         Amount& claimed);

  /**
   * Sets the approved delegate of a bond.  The empty string clears it.
   */
  ErrorCode Approve (const std::string& caller, Database::IdT bondId,
                     const std::string& approved);

  /**
   * Sets or revokes an operator for all bonds of the caller.
   */
  ErrorCode SetApprovalForAll (const std::string& caller,
                               const std::string& op, bool approved);

  ErrorCode TransferBond (const std::string& caller, Database::IdT bondId,
                          const std::string& to);

};

} // namespace bonds

#endif // BONDS_BONDTELLER_HPP
