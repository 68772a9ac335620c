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

#ifndef BONDS_ERRORS_HPP
#define BONDS_ERRORS_HPP

#include <ostream>
#include <string>

namespace bonds
{

/**
 * Reasons why a call (deposit, claim, administrative setter, ledger
 * operation or quote) can fail.  Failed calls leave no trace in the
 * state, and the reason is logged and returned to RPC callers through
 * its string form.
 */
enum class ErrorCode
{

  OK = 0,

  /* Configuration errors.  */
  ZERO_ADDRESS_GOVERNANCE,
  ZERO_ADDRESS_REWARD,
  ZERO_ADDRESS_LOCK_VAULT,
  ZERO_ADDRESS_POOL,
  ZERO_ADDRESS_DAO,
  ZERO_ADDRESS_PRINCIPAL,
  INVALID_PRICE,
  ZERO_DENOMINATOR,
  INVALID_DATES,
  INVALID_HALF_LIFE,
  INVALID_FEE,
  TELLER_EXISTS,

  /* Temporal and state errors.  */
  PAUSED,
  NOT_INITIALISED,
  NOT_STARTED,
  CONCLUDED,
  ZERO_PRICE,
  LOCKED,

  /* Capacity and size errors.  */
  AT_CAPACITY,
  TOO_LARGE,
  SLIPPAGE,
  ZERO_PAYOUT,
  ZERO_AMOUNT,
  LOCK_TOO_LONG,
  INSUFFICIENT_BALANCE,
  INSUFFICIENT_ALLOWANCE,
  SUPPLY_OVERFLOW,

  /* Authorisation errors.  */
  NOT_GOVERNANCE,
  NOT_PENDING_GOVERNANCE,
  NOT_TELLER,
  NOT_MINTER,
  NOT_BONDER,
  NOT_LOCK_OWNER,
  PERMIT_UNSUPPORTED,
  PERMIT_EXPIRED,

  /* Not-found and invalid-argument errors.  */
  INVALID_ADDRESS,
  NONEXISTENT_TOKEN,
  UNKNOWN_ASSET,
  UNKNOWN_TELLER,
  UNKNOWN_DEPOSITORY,

};

/**
 * Returns the reason string for an error code, e.g. "bond at capacity".
 */
std::string ErrorToString (ErrorCode err);

std::ostream& operator<< (std::ostream& out, ErrorCode err);

} // namespace bonds

#endif // BONDS_ERRORS_HPP
