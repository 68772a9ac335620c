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

#ifndef BONDS_LOCKVAULT_HPP
#define BONDS_LOCKVAULT_HPP

#include "context.hpp"
#include "errors.hpp"
#include "ledger.hpp"

#include "database/amount.hpp"
#include "database/database.hpp"
#include "database/eventlog.hpp"
#include "database/lock.hpp"

#include <string>

namespace bonds
{

/**
 * Operations of the lock vaults, which hold time-locked positions.  The
 * locked coins are held in the ledger by the vault's address.  Lock vault
 * addresses are system addresses (starting with "@").
 */
class LockVault
{

private:

  /** The vault's address.  */
  const std::string address;

  const Context& ctx;
  Ledger& ledger;

  EventLog events;
  LocksTable locks;

public:

  explicit LockVault (Database& db, const Context& c, Ledger& l,
                      const std::string& addr);

  LockVault () = delete;
  LockVault (const LockVault&) = delete;
  void operator= (const LockVault&) = delete;

  /**
   * Returns true if the given address can be used for a lock vault.
   */
  static bool IsValidAddress (const std::string& addr);

  /**
   * Creates a new lock for the owner, funded from the funder's balance
   * of the given asset.  On success, the ID of the lock is returned
   * through lockId.
   */
  ErrorCode CreateLock (const std::string& funder, const std::string& owner,
                        const std::string& asset, Amount amount, int64_t end,
                        Database::IdT& lockId);

  /**
   * Withdraws an expired lock to the recipient.  Only the owner
   * can do this.
   */
  ErrorCode Withdraw (const std::string& caller, Database::IdT lockId,
                      const std::string& recipient);

};

} // namespace bonds

#endif // BONDS_LOCKVAULT_HPP
