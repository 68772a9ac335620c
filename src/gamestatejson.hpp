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

#ifndef BONDS_GAMESTATEJSON_HPP
#define BONDS_GAMESTATEJSON_HPP

#include "context.hpp"

#include "database/asset.hpp"
#include "database/bond.hpp"
#include "database/database.hpp"
#include "database/depository.hpp"
#include "database/lock.hpp"
#include "database/teller.hpp"

#include <json/json.h>

#include <string>

namespace bonds
{

/**
 * Utility class that handles construction of game-state JSON.
 */
class GameStateJson
{

private:

  /** Database to read from.  */
  Database& db;

  /**
   * Assets table, used from the "convert" function for assets to look
   * up the minters.
   */
  mutable AssetsTable assets;

  /** Current parameter context.  */
  const Context& ctx;

  /**
   * Extracts all results from the Database::Result instance, converts them
   * to JSON, and returns a JSON array.
   */
  template <typename T, typename R>
    Json::Value ResultsAsArray (T& tbl, Database::Result<R> res) const;

public:

  explicit GameStateJson (Database& d, const Context& c)
    : db(d), assets(db), ctx(c)
  {}

  GameStateJson () = delete;
  GameStateJson (const GameStateJson&) = delete;
  void operator= (const GameStateJson&) = delete;

  /**
   * Converts a state instance (like a Teller or Bond) to the corresponding
   * JSON value in the game state.
   */
  template <typename T>
    Json::Value Convert (const T& val) const;

  /**
   * Returns the JSON data for all assets, including their supply.
   */
  Json::Value Assets ();

  /**
   * Returns all non-zero balances, as object keyed by account and then
   * by asset.
   */
  Json::Value Balances ();

  /**
   * Returns the balances of one account, keyed by asset.
   */
  Json::Value Balances (const std::string& account);

  /**
   * Returns all non-zero allowances.
   */
  Json::Value Allowances ();

  /**
   * Returns the JSON data for all bond depositories.
   */
  Json::Value Depositories ();

  /**
   * Returns the JSON data for all tellers.
   */
  Json::Value Tellers ();

  /**
   * Returns all bonds in existence.
   */
  Json::Value Bonds ();

  /**
   * Returns the bonds owned by the given account.
   */
  Json::Value Bonds (const std::string& owner);

  /**
   * Returns all locks in existence.
   */
  Json::Value Locks ();

  /**
   * Returns the locks owned by the given account.
   */
  Json::Value Locks (const std::string& owner);

  /**
   * Returns the most recent events, optionally filtered by emitter (if
   * it is non-empty).  The number of events is capped by the configured
   * maximum.
   */
  Json::Value Events (const std::string& emitter, unsigned limit);

  /**
   * Returns the full game state JSON for the given Database handle.  The full
   * game state as JSON should mainly be used for debugging and testing, not
   * in production.  For that, more targeted RPC results should be used.
   */
  Json::Value FullState ();

};

} // namespace bonds

#endif // BONDS_GAMESTATEJSON_HPP
