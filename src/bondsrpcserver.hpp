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

#ifndef BONDS_BONDSRPCSERVER_HPP
#define BONDS_BONDSRPCSERVER_HPP

#include "rpc-stubs/bondsrpcserverstub.h"

#include "bondteller.hpp"
#include "errors.hpp"
#include "logic.hpp"

#include "database/amount.hpp"

#include <xayagame/game.hpp>

#include <json/json.h>
#include <jsonrpccpp/server.h>

#include <cstdint>
#include <functional>
#include <string>

namespace bonds
{

/**
 * Arguments of the teller quote methods, as passed in their "quote"
 * object.  The timestamp is parsed the same way for all of them, so that
 * 64-bit block times are accepted.
 */
struct QuoteArguments
{

  /** The amount to quote for (not used by currentprice).  */
  Amount amount = 0;

  /** Timestamp of the block for which the quote is made.  */
  int64_t timestamp = 0;

  /** Whether the quote is for a staked deposit.  */
  bool stake = false;

  /**
   * Parses the quote object.  If withAmount is false, only the timestamp
   * is read and "amount" must not be present.  Throws a JSON-RPC
   * exception with the INVALID_ARGUMENT code if the data is invalid.
   */
  static QuoteArguments Parse (const Json::Value& quote, bool withAmount);

};

/**
 * Implementation of the JSON-RPC interface to the GSP.  This mostly
 * contains methods that query the game-state database in some way, plus
 * the read-only price quotes of tellers.
 */
class BondsRpcServer : public BondsRpcServerStub
{

private:

  /** The underlying Game instance that manages everything.  */
  xaya::Game& game;

  /** The game logic implementation.  */
  BondsLogic& logic;

  /**
   * Runs a quote on the given teller with a context at the given
   * timestamp.  The callback receives the teller and returns the
   * ErrorCode of the quote, which is turned into a JSON-RPC error
   * if it is not OK.
   */
  Json::Value RunQuote (const std::string& teller, int64_t timestamp,
                        const std::function<ErrorCode (BondTeller& t,
                                                       Amount& res)>& cb);

public:

  explicit BondsRpcServer (xaya::Game& g, BondsLogic& l,
                           jsonrpc::AbstractServerConnector& conn)
    : BondsRpcServerStub(conn), game(g), logic(l)
  {}

  void stop () override;
  Json::Value getcurrentstate () override;
  Json::Value getnullstate () override;
  std::string waitforchange (const std::string& knownBlock) override;

  Json::Value getassets () override;
  Json::Value getbalances (const std::string& account) override;
  Json::Value getdepositories () override;
  Json::Value gettellers () override;
  Json::Value getbonds (const std::string& owner) override;
  Json::Value getlocks (const std::string& owner) override;
  Json::Value getevents (const std::string& emitter, int limit) override;

  Json::Value currentprice (const Json::Value& quote,
                            const std::string& teller) override;
  Json::Value calculateamountout (const Json::Value& quote,
                                  const std::string& teller) override;
  Json::Value calculateamountin (const Json::Value& quote,
                                 const std::string& teller) override;
  std::string predicttelleraddress (const std::string& depository,
                                    const std::string& salt) override;

};

} // namespace bonds

#endif // BONDS_BONDSRPCSERVER_HPP
