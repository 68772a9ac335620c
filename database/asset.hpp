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

#ifndef DATABASE_ASSET_HPP
#define DATABASE_ASSET_HPP

#include "database.hpp"
#include "lazyproto.hpp"

#include "proto/asset.pb.h"

#include <memory>
#include <string>
#include <vector>

namespace bonds
{

/**
 * Database result type for rows from the assets table.
 */
struct AssetResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, name, 1);
  RESULT_COLUMN (bonds::proto::Asset, proto, 2);
};

/**
 * Wrapper class around the state of one asset in the database.
 * Instances should be obtained through the AssetsTable.
 */
class Asset
{

private:

  /** Database reference this belongs to.  */
  Database& db;

  /** The name of this asset.  */
  std::string name;

  /** General proto data.  */
  LazyProto<proto::Asset> data;

  /** Whether or not this is a new instance.  */
  bool isNew;

  /**
   * Constructs a new instance with default data for the given name.
   */
  explicit Asset (Database& d, const std::string& n);

  /**
   * Constructs an instance based on the given DB result set.
   */
  explicit Asset (Database& d, const Database::Result<AssetResult>& res);

  friend class AssetsTable;

public:

  /**
   * In the destructor, the underlying database is updated if there are any
   * modifications to send.
   */
  ~Asset ();

  Asset () = delete;
  Asset (const Asset&) = delete;
  void operator= (const Asset&) = delete;

  const std::string&
  GetName () const
  {
    return name;
  }

  const proto::Asset&
  GetProto () const
  {
    return data.Get ();
  }

  proto::Asset&
  MutableProto ()
  {
    return data.Mutable ();
  }

};

/**
 * Utility class that handles querying the assets table and the minter
 * sets in the database.
 */
class AssetsTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Movable handle to an asset instance.  */
  using Handle = std::unique_ptr<Asset>;

  explicit AssetsTable (Database& d)
    : db(d)
  {}

  AssetsTable () = delete;
  AssetsTable (const AssetsTable&) = delete;
  void operator= (const AssetsTable&) = delete;

  /**
   * Creates a new entry in the database for the given name.  It is an
   * error if the asset exists already.
   */
  Handle CreateNew (const std::string& name);

  /**
   * Returns a handle for the instance based on a Database::Result.
   */
  Handle GetFromResult (const Database::Result<AssetResult>& res);

  /**
   * Returns the asset with the given name or null if it does not exist.
   */
  Handle GetByName (const std::string& name);

  /**
   * Queries the database for all assets, ordered by name.
   */
  Database::Result<AssetResult> QueryAll ();

  /**
   * Returns true if the given account is a minter of the asset.
   */
  bool IsMinter (const std::string& asset, const std::string& minter);

  /**
   * Adds a minter to the asset.  Does nothing if it is one already.
   */
  void AddMinter (const std::string& asset, const std::string& minter);

  /**
   * Removes a minter.  Does nothing if the account is not a minter.
   */
  void RemoveMinter (const std::string& asset, const std::string& minter);

  /**
   * Returns all minters of an asset in alphabetical order.
   */
  std::vector<std::string> GetMinters (const std::string& asset);

};

} // namespace bonds

#endif // DATABASE_ASSET_HPP
