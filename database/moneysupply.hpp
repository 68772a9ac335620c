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

#ifndef DATABASE_MONEYSUPPLY_HPP
#define DATABASE_MONEYSUPPLY_HPP

#include "amount.hpp"
#include "database.hpp"

#include <string>

namespace bonds
{

/**
 * Wrapper class around the database table holding the total supply
 * of each asset in the ledger.
 */
class MoneySupply
{

private:

  /** The underlying database handle.  */
  Database& db;

public:

  explicit MoneySupply (Database& d)
    : db(d)
  {}

  MoneySupply () = delete;
  MoneySupply (const MoneySupply&) = delete;
  void operator= (const MoneySupply&) = delete;

  /**
   * Returns the total supply of the given asset.  This CHECK-fails if the
   * asset has not been initialised.
   */
  Amount Get (const std::string& asset);

  /**
   * Increments the supply for the given asset, e.g. when minting.
   */
  void Increment (const std::string& asset, Amount value);

  /**
   * Adds the row for a newly registered asset, with zero supply.
   */
  void InitialiseAsset (const std::string& asset);

};

} // namespace bonds

#endif // DATABASE_MONEYSUPPLY_HPP
