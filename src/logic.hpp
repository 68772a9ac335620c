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

#ifndef BONDS_LOGIC_HPP
#define BONDS_LOGIC_HPP

#include "context.hpp"
#include "gamestatejson.hpp"

#include "database/database.hpp"

#include <xayagame/sqlitegame.hpp>
#include <xayagame/sqlitestorage.hpp>

#include <json/json.h>

#include <functional>
#include <string>

namespace bonds
{

class BondsLogic;

/**
 * Database instance that uses an SQLiteGame instance for everything.
 */
class SQLiteGameDatabase : public Database
{

private:

  /** The underlying SQLiteGame instance.  */
  BondsLogic& game;

public:

  explicit SQLiteGameDatabase (xaya::SQLiteDatabase& d, BondsLogic& g);

  SQLiteGameDatabase () = delete;
  SQLiteGameDatabase (const SQLiteGameDatabase&) = delete;
  void operator= (const SQLiteGameDatabase&) = delete;

  Database::IdT GetNextId () override;
  Database::IdT GetLogId () override;

};

/**
 * The game logic implementation for the bond sale engine.  This is the main
 * class that acts as the game-specific code, interacting with libxayagame
 * and the Xaya daemon.  By itself, it is combining the various other classes
 * and functions that implement the real logic.
 */
class BondsLogic : public xaya::SQLiteGame
{

private:

  /**
   * Handles the actual logic for the game-state update.  This is extracted
   * here out of UpdateState, so that it can be accessed from unit tests
   * independently of SQLiteGame.
   */
  static void UpdateState (Database& db, xaya::Chain chain,
                           const Json::Value& blockData);

  /**
   * Processes the moves of a block with a given context.
   */
  static void UpdateState (Database& db, const Context& ctx,
                           const Json::Value& blockData);

  /**
   * Sets up the assets, depositories and initial balances from the
   * read-only configuration.
   */
  static void InitialiseFromConfig (Database& db, const Context& ctx);

  /**
   * Performs (potentially slow) validations on the current database state.
   * This is used when compiled with ENABLE_SLOW_ASSERTS after each block
   * update, for testing purposes.  It should not be run in production builds
   * because it may really slow down syncing.  If an error is detected, then
   * this CHECK-fails the binary.
   */
  static void ValidateStateSlow (Database& db, const Context& ctx);

  friend class BondsLogicTests;
  friend class SQLiteGameDatabase;

protected:

  void SetupSchema (xaya::SQLiteDatabase& db) override;

  void GetInitialStateBlock (unsigned& height,
                             std::string& hashHex) const override;
  void InitialiseState (xaya::SQLiteDatabase& db) override;

  void UpdateState (xaya::SQLiteDatabase& db,
                    const Json::Value& blockData) override;

  Json::Value GetStateAsJson (const xaya::SQLiteDatabase& db) override;

public:

  /**
   * Type for a callback that retrieves some JSON data from the database
   * directly (not using GameStateJson).
   */
  using JsonStateFromRawDb
      = std::function<Json::Value (Database& db, const xaya::uint256& hash,
                                   unsigned height)>;

  /** Type for a callback that retrieves JSON data from the database.  */
  using JsonStateFromDatabase = std::function<Json::Value (GameStateJson& gsj)>;

  BondsLogic () = default;

  BondsLogic (const BondsLogic&) = delete;
  void operator= (const BondsLogic&) = delete;

  /**
   * Returns custom game-state data as JSON, with a callback that
   * directly receives the database (and does not go through the
   * GameStateJson class).
   */
  Json::Value GetCustomStateData (xaya::Game& game,
                                  const JsonStateFromRawDb& cb);

  /**
   * Returns custom game-state data as JSON.  The provided callback is invoked
   * with a GameStateJson instance to retrieve the "main" state data that is
   * returned in the JSON "data" field.
   */
  Json::Value GetCustomStateData (xaya::Game& game,
                                  const JsonStateFromDatabase& cb);

};

} // namespace bonds

#endif // BONDS_LOGIC_HPP
