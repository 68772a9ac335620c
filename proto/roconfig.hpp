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

#ifndef PROTO_ROCONFIG_HPP
#define PROTO_ROCONFIG_HPP

#include "proto/config.pb.h"

#include <xayagame/gamelogic.hpp>

#include <string>

namespace bonds
{

/**
 * A light wrapper class around the read-only ConfigData proto.  It allows
 * access to the proto data itself as well as provides some helper methods
 * for looking up entries of it.
 */
class RoConfig
{

private:

  /**
   * A reference to the singleton proto instance for the chain this was
   * constructed for.
   */
  const proto::ConfigData* data;

  /**
   * The global singleton instance for mainnet or null when it is not yet
   * initialised.  This is never destructed.
   */
  static proto::ConfigData* mainnet;

  /** The singleton instance for testnet.  */
  static proto::ConfigData* testnet;

  /** The singleton instance for regtest.  */
  static proto::ConfigData* regtest;

public:

  /**
   * Constructs a fresh instance of the wrapper class, which will give
   * access to the underlying data.
   *
   * On the first call, this will also parse the embedded text data and set
   * up the underlying singleton instance for the chain.
   */
  explicit RoConfig (xaya::Chain chain);

  RoConfig (const RoConfig&) = delete;
  void operator= (const RoConfig&) = delete;

  /**
   * Exposes the actual protocol buffer.
   */
  const proto::ConfigData& operator* () const;

  /**
   * Exposes the actual protocol buffer's fields directly.
   */
  const proto::ConfigData* operator-> () const;

  /**
   * Looks up the initial configuration of an asset by name.  Returns null
   * if there is no such asset configured.
   */
  const proto::AssetConfig* AssetOrNull (const std::string& name) const;

  /**
   * Looks up the initial configuration of a depository by address.
   * Returns null if there is none.
   */
  const proto::DepositoryConfig* DepositoryOrNull (
      const std::string& address) const;

};

} // namespace bonds

#endif // PROTO_ROCONFIG_HPP
