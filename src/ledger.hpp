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

#ifndef BONDS_LEDGER_HPP
#define BONDS_LEDGER_HPP

#include "context.hpp"
#include "errors.hpp"

#include "database/amount.hpp"
#include "database/asset.hpp"
#include "database/balances.hpp"
#include "database/database.hpp"
#include "database/eventlog.hpp"
#include "database/moneysupply.hpp"
#include "proto/config.pb.h"

#include <string>

namespace bonds
{

/**
 * The asset ledger on which tellers, depositories and lock vaults operate.
 * It holds balances and allowances for all assets, and performs transfers
 * and minting with the necessary checks.  All methods that can fail
 * return an ErrorCode and do not modify the state in that case.
 */
class Ledger
{

private:

  /** Database handle.  */
  Database& db;

  /** Context for the current block.  */
  const Context& ctx;

  /** Event log for minter changes.  */
  EventLog events;

  AssetsTable assets;
  Balances balances;
  MoneySupply supply;

  /**
   * Moves the amount from one account to another, assuming that all
   * checks have been done already.
   */
  void Move (const std::string& from, const std::string& to,
             const std::string& asset, Amount amount);

public:

  explicit Ledger (Database& d, const Context& c);

  Ledger () = delete;
  Ledger (const Ledger&) = delete;
  void operator= (const Ledger&) = delete;

  /**
   * Registers a new asset based on its initial configuration.
   */
  void RegisterAsset (const proto::AssetConfig& cfg);

  /**
   * Returns true if the asset exists.
   */
  bool AssetExists (const std::string& asset);

  /**
   * Returns true if the asset exists and is a native wrapper.
   */
  bool IsNative (const std::string& asset);

  /**
   * Returns true if the asset exists and supports permits.
   */
  bool SupportsPermit (const std::string& asset);

  Amount GetBalance (const std::string& account, const std::string& asset);
  Amount GetAllowance (const std::string& owner, const std::string& spender,
                       const std::string& asset);

  /**
   * Transfers an asset from the caller to another account.
   */
  ErrorCode Transfer (const std::string& from, const std::string& to,
                      const std::string& asset, Amount amount);

  /**
   * Transfers an asset from the owner to another account, spending
   * allowance granted to the spender.
   */
  ErrorCode TransferFrom (const std::string& spender, const std::string& from,
                          const std::string& to, const std::string& asset,
                          Amount amount);

  /**
   * Sets the allowance of owner for spender.
   */
  ErrorCode Approve (const std::string& owner, const std::string& spender,
                     const std::string& asset, Amount amount);

  /**
   * Grants an allowance inline, as done with a signed permit.  This fails
   * if the asset does not support permits or the deadline has passed.
   */
  ErrorCode Permit (const std::string& owner, const std::string& spender,
                    const std::string& asset, Amount amount,
                    int64_t deadline);

  /**
   * Mints new coins of an asset.  The caller must be a minter.
   */
  ErrorCode Mint (const std::string& minter, const std::string& to,
                  const std::string& asset, Amount amount);

  /**
   * Creates new coins without authorisation checks.  This is used for
   * wrapping native payments and for initial balances from the
   * configuration.
   */
  void Issue (const std::string& to, const std::string& asset, Amount amount);

  /**
   * Adds a minter to the asset.  The caller must be the asset's governance.
   */
  ErrorCode AddMinter (const std::string& caller, const std::string& asset,
                       const std::string& minter);

  /**
   * Removes a minter.  The caller must be the asset's governance.
   */
  ErrorCode RemoveMinter (const std::string& caller, const std::string& asset,
                          const std::string& minter);

  /**
   * Returns true if the account is a minter of the asset.
   */
  bool IsMinter (const std::string& asset, const std::string& minter);

  /**
   * Proposes a new governance for an asset.
   */
  ErrorCode SetPendingGovernance (const std::string& caller,
                                  const std::string& asset,
                                  const std::string& pending);

  /**
   * Accepts governance of an asset.
   */
  ErrorCode AcceptGovernance (const std::string& caller,
                              const std::string& asset);

};

} // namespace bonds

#endif // BONDS_LEDGER_HPP
