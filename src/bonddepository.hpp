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

#ifndef BONDS_BONDDEPOSITORY_HPP
#define BONDS_BONDDEPOSITORY_HPP

#include "context.hpp"
#include "errors.hpp"
#include "ledger.hpp"

#include "database/amount.hpp"
#include "database/database.hpp"
#include "database/depository.hpp"
#include "database/eventlog.hpp"
#include "database/teller.hpp"
#include "proto/config.pb.h"
#include "proto/teller.pb.h"

#include <cstdint>
#include <string>

namespace bonds
{

/**
 * Logic of a bond depository.  The depository keeps the set of tellers
 * authorised to draw reward from it, mints reward for them on deposits
 * and acts as factory for new tellers.
 */
class BondDepository
{

private:

  /** The depository's address.  */
  const std::string address;

  const Context& ctx;
  Ledger& ledger;

  EventLog events;
  DepositoriesTable depositories;
  TellersTable tellers;

public:

  /** Prefix of all teller addresses created by the factory.  */
  static constexpr const char* TELLER_PREFIX = "@teller-";

  explicit BondDepository (Database& db, const Context& c, Ledger& l,
                           const std::string& addr);

  BondDepository () = delete;
  BondDepository (const BondDepository&) = delete;
  void operator= (const BondDepository&) = delete;

  /**
   * Creates the depository from its initial configuration.
   */
  static void Initialise (Database& db, const proto::DepositoryConfig& cfg);

  /**
   * Returns the address a teller created with the given salt will have.
   */
  static std::string TellerAddress (const std::string& depository,
                                    const std::string& salt);

  /**
   * Returns the address of a teller created without salt when the
   * depository's nonce has the given value.  Salted and nonce-based
   * addresses are hashed with different tags, so they never collide.
   */
  static std::string NonceTellerAddress (const std::string& depository,
                                         uint64_t nonce);

  /**
   * Returns the address the next teller created with the given salt
   * will have.  An empty salt means that the depository's nonce is used.
   * Returns the empty string if the depository does not exist.
   */
  std::string PredictTellerAddress (const std::string& salt);

  ErrorCode AddTeller (const std::string& caller, const std::string& teller);
  ErrorCode RemoveTeller (const std::string& caller,
                          const std::string& teller);

  /**
   * Returns true if the teller is authorised to draw from the depository.
   */
  bool IsTeller (const std::string& teller);

  ErrorCode SetAddresses (const std::string& caller,
                          const std::string& reward,
                          const std::string& lockVault,
                          const std::string& pool, const std::string& dao);

  ErrorCode SetPendingGovernance (const std::string& caller,
                                  const std::string& pending);
  ErrorCode AcceptGovernance (const std::string& caller);

  /**
   * Mints the given amount of reward to the teller calling this.
   */
  ErrorCode PullReward (const std::string& teller, Amount amount);

  /**
   * Creates a new teller.  The name, principal, permittable, kind and
   * receiver fields are taken from init, while the other addresses are
   * copied from the depository.  On success, the new teller's address
   * is returned through tellerAddress.
   */
  ErrorCode CreateTeller (const std::string& caller,
                          const proto::TellerConfig& init,
                          const std::string& governance,
                          const std::string& salt,
                          std::string& tellerAddress);

};

} // namespace bonds

#endif // BONDS_BONDDEPOSITORY_HPP
