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

#ifndef BONDS_MOVEPROCESSOR_HPP
#define BONDS_MOVEPROCESSOR_HPP

#include "bondteller.hpp"
#include "context.hpp"
#include "ledger.hpp"

#include "database/amount.hpp"
#include "database/database.hpp"
#include "database/teller.hpp"

#include <json/json.h>

#include <string>

namespace bonds
{

/**
 * Class that handles processing of all moves made in a block.  Each
 * command in a move is one call of the bond engine, executed atomically
 * in its own savepoint.  Invalid commands are logged and ignored.
 */
class MoveProcessor
{

private:

  /** Processing context data.  */
  const Context& ctx;

  /** The Database handle we use for making any changes.  */
  Database& db;

  /** The asset ledger.  */
  Ledger ledger;

  /** Access to tellers, used to look up native receivers.  */
  TellersTable tellers;

  /**
   * Parses some basic stuff from a move JSON object.  This extracts the
   * actual move JSON value and the name.  The function returns true if
   * the move may be processed further.
   */
  bool ExtractMoveBasics (const Json::Value& moveObj,
                          std::string& name, Json::Value& mv) const;

  /**
   * Processes the move corresponding to one transaction.
   */
  void ProcessOne (const Json::Value& moveObj);

  /**
   * Handles ledger commands (transfers, approvals, minting and asset
   * governance).
   */
  void TryLedgerOperations (const std::string& name, const Json::Value& cmd);

  /**
   * Handles commands to bond depositories.
   */
  void TryDepositoryOperations (const std::string& name,
                                const Json::Value& cmd);

  /**
   * Handles commands for one depository.
   */
  void TryDepositoryUpdate (const std::string& name,
                            const std::string& address,
                            const Json::Value& upd);

  /**
   * Handles commands to tellers (administration, deposits and bonds).
   */
  void TryTellerOperations (const std::string& name, const Json::Value& cmd);

  /**
   * Handles commands for one teller.
   */
  void TryTellerUpdate (const std::string& name, BondTeller& teller,
                        const Json::Value& upd);

  /**
   * Handles commands to lock vaults.
   */
  void TryLockVaultOperations (const std::string& name,
                               const Json::Value& cmd);

  /**
   * Processes payments in CHI to receivers of native tellers, which
   * are deposits into them.
   */
  void TryNativeDeposits (const std::string& name, const Json::Value& mv,
                          const Json::Value& out);

public:

  explicit MoveProcessor (Database& d, const Context& c);

  MoveProcessor () = delete;
  MoveProcessor (const MoveProcessor&) = delete;
  void operator= (const MoveProcessor&) = delete;

  /**
   * Processes all moves from the given JSON array.
   */
  void ProcessAll (const Json::Value& moveArray);

};

} // namespace bonds

#endif // BONDS_MOVEPROCESSOR_HPP
