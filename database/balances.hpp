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

#ifndef DATABASE_BALANCES_HPP
#define DATABASE_BALANCES_HPP

#include "amount.hpp"
#include "database.hpp"

#include <string>

namespace bonds
{

/**
 * Database result type for rows of the balances table.
 */
struct BalanceResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, account, 1);
  RESULT_COLUMN (std::string, asset, 2);
  RESULT_COLUMN (int64_t, amount, 3);
};

/**
 * Database result type for rows of the allowances table.
 */
struct AllowanceResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, owner, 1);
  RESULT_COLUMN (std::string, spender, 2);
  RESULT_COLUMN (std::string, asset, 3);
  RESULT_COLUMN (int64_t, amount, 4);
};

/**
 * Wrapper class around the tables of asset balances and allowances.
 * This is the raw storage; validation of transfers (e.g. that the
 * sender has enough) is done by the Ledger, and violations here
 * are CHECK failures.
 */
class Balances
{

private:

  /** The underlying database handle.  */
  Database& db;

public:

  explicit Balances (Database& d)
    : db(d)
  {}

  Balances () = delete;
  Balances (const Balances&) = delete;
  void operator= (const Balances&) = delete;

  /**
   * Returns the balance of an account in the given asset (zero if there
   * is no entry).
   */
  Amount Get (const std::string& account, const std::string& asset);

  /**
   * Updates the balance by the given (signed) amount.  The resulting
   * balance must be within [0, MAX_AMOUNT].
   */
  void Add (const std::string& account, const std::string& asset, Amount val);

  /**
   * Returns the allowance granted by owner to spender.
   */
  Amount GetAllowance (const std::string& owner, const std::string& spender,
                       const std::string& asset);

  /**
   * Sets the allowance of owner to spender to the given value.
   */
  void SetAllowance (const std::string& owner, const std::string& spender,
                     const std::string& asset, Amount val);

  /**
   * Queries for all non-zero balances, ordered by account and asset.
   */
  Database::Result<BalanceResult> QueryAll ();

  /**
   * Queries for all non-zero balances of one account.
   */
  Database::Result<BalanceResult> QueryForAccount (const std::string& account);

  /**
   * Queries for all non-zero allowances.
   */
  Database::Result<AllowanceResult> QueryAllowances ();

};

} // namespace bonds

#endif // DATABASE_BALANCES_HPP
