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

#include "bondsrpcserver.hpp"

#include "bonddepository.hpp"
#include "bondteller.hpp"
#include "jsonutils.hpp"
#include "ledger.hpp"

#include <xayagame/gamerpcserver.hpp>

#include <glog/logging.h>

#include <sstream>

namespace bonds
{

/* ************************************************************************** */

namespace
{

/**
 * Error codes returned from the RPC server.  All values should have an
 * explicit integer number, because this also defines the RPC protocol
 * itself for clients that do not have access to the enum directly and
 * only read the integer values.
 */
enum class RpcErrorCode
{

  /* Invalid values for arguments (e.g. a malformed quote or a negative
     timestamp).  */
  INVALID_ARGUMENT = -1,

  /* The depository passed to predicttelleraddress does not exist.  */
  UNKNOWN_DEPOSITORY = -2,

  /* A quote was rejected by the teller.  The message is the reason
     as it would be reported for a deposit.  */
  QUOTE_FAILED = 1,

};

/**
 * Throws a JSON-RPC error from the current method.  This throws an exception,
 * so does not return to the caller in a normal way.
 */
void
ReturnError (const RpcErrorCode code, const std::string& msg)
{
  throw jsonrpc::JsonRpcException (static_cast<int> (code), msg);
}

} // anonymous namespace

QuoteArguments
QuoteArguments::Parse (const Json::Value& quote, const bool withAmount)
{
  if (!quote.isObject ())
    ReturnError (RpcErrorCode::INVALID_ARGUMENT, "quote is not an object");

  QuoteArguments res;

  if (withAmount)
    {
      if (!AssetAmountFromJson (quote["amount"], res.amount))
        ReturnError (RpcErrorCode::INVALID_ARGUMENT,
                     "invalid amount in quote");
    }
  else if (quote.isMember ("amount"))
    ReturnError (RpcErrorCode::INVALID_ARGUMENT,
                 "unexpected amount in quote");

  if (!TimeFromJson (quote["timestamp"], res.timestamp))
    ReturnError (RpcErrorCode::INVALID_ARGUMENT,
                 "invalid timestamp in quote");

  if (quote.isMember ("stake"))
    {
      if (!quote["stake"].isBool ())
        ReturnError (RpcErrorCode::INVALID_ARGUMENT,
                     "invalid stake flag in quote");
      res.stake = quote["stake"].asBool ();
    }

  return res;
}

/* ************************************************************************** */

void
BondsRpcServer::stop ()
{
  LOG (INFO) << "RPC method called: stop";
  game.RequestStop ();
}

Json::Value
BondsRpcServer::getcurrentstate ()
{
  LOG (INFO) << "RPC method called: getcurrentstate";
  return game.GetCurrentJsonState ();
}

Json::Value
BondsRpcServer::getnullstate ()
{
  LOG (INFO) << "RPC method called: getnullstate";
  return game.GetNullJsonState ();
}

std::string
BondsRpcServer::waitforchange (const std::string& knownBlock)
{
  LOG (INFO) << "RPC method called: waitforchange " << knownBlock;
  return xaya::GameRpcServer::DefaultWaitForChange (game, knownBlock);
}

Json::Value
BondsRpcServer::getassets ()
{
  LOG (INFO) << "RPC method called: getassets";
  return logic.GetCustomStateData (game,
    [] (GameStateJson& gsj)
      {
        return gsj.Assets ();
      });
}

Json::Value
BondsRpcServer::getbalances (const std::string& account)
{
  LOG (INFO) << "RPC method called: getbalances " << account;
  return logic.GetCustomStateData (game,
    [&account] (GameStateJson& gsj)
      {
        if (account.empty ())
          return gsj.Balances ();
        return gsj.Balances (account);
      });
}

Json::Value
BondsRpcServer::getdepositories ()
{
  LOG (INFO) << "RPC method called: getdepositories";
  return logic.GetCustomStateData (game,
    [] (GameStateJson& gsj)
      {
        return gsj.Depositories ();
      });
}

Json::Value
BondsRpcServer::gettellers ()
{
  LOG (INFO) << "RPC method called: gettellers";
  return logic.GetCustomStateData (game,
    [] (GameStateJson& gsj)
      {
        return gsj.Tellers ();
      });
}

Json::Value
BondsRpcServer::getbonds (const std::string& owner)
{
  LOG (INFO) << "RPC method called: getbonds " << owner;
  return logic.GetCustomStateData (game,
    [&owner] (GameStateJson& gsj)
      {
        if (owner.empty ())
          return gsj.Bonds ();
        return gsj.Bonds (owner);
      });
}

Json::Value
BondsRpcServer::getlocks (const std::string& owner)
{
  LOG (INFO) << "RPC method called: getlocks " << owner;
  return logic.GetCustomStateData (game,
    [&owner] (GameStateJson& gsj)
      {
        if (owner.empty ())
          return gsj.Locks ();
        return gsj.Locks (owner);
      });
}

Json::Value
BondsRpcServer::getevents (const std::string& emitter, const int limit)
{
  LOG (INFO) << "RPC method called: getevents " << emitter << " " << limit;
  if (limit <= 0)
    ReturnError (RpcErrorCode::INVALID_ARGUMENT, "limit must be positive");

  return logic.GetCustomStateData (game,
    [&emitter, limit] (GameStateJson& gsj)
      {
        return gsj.Events (emitter, limit);
      });
}

Json::Value
BondsRpcServer::RunQuote (
    const std::string& teller, const int64_t timestamp,
    const std::function<ErrorCode (BondTeller& t, Amount& res)>& cb)
{
  return logic.GetCustomStateData (game,
    [&] (Database& db, const xaya::uint256& hash, const unsigned height)
      {
        /* The quote is done as if in the next block at the given time.  */
        const Context ctx(logic.GetChain (), height + 1, timestamp);
        Ledger ledger(db, ctx);
        BondTeller t(db, ctx, ledger, teller);

        Amount res;
        const ErrorCode err = cb (t, res);
        if (err != ErrorCode::OK)
          {
            std::ostringstream msg;
            msg << err;
            ReturnError (RpcErrorCode::QUOTE_FAILED, msg.str ());
          }

        return IntToJson (res);
      });
}

Json::Value
BondsRpcServer::currentprice (const Json::Value& quote,
                              const std::string& teller)
{
  LOG (INFO)
      << "RPC method called: currentprice " << teller << "\n" << quote;

  const auto args = QuoteArguments::Parse (quote, false);
  return RunQuote (teller, args.timestamp,
    [] (BondTeller& t, Amount& res)
      {
        return t.CurrentPrice (res);
      });
}

Json::Value
BondsRpcServer::calculateamountout (const Json::Value& quote,
                                    const std::string& teller)
{
  LOG (INFO)
      << "RPC method called: calculateamountout " << teller << "\n" << quote;

  const auto args = QuoteArguments::Parse (quote, true);

  return RunQuote (teller, args.timestamp,
    [&args] (BondTeller& t, Amount& res)
      {
        return t.CalculateAmountOut (args.amount, args.stake, res);
      });
}

Json::Value
BondsRpcServer::calculateamountin (const Json::Value& quote,
                                   const std::string& teller)
{
  LOG (INFO)
      << "RPC method called: calculateamountin " << teller << "\n" << quote;

  const auto args = QuoteArguments::Parse (quote, true);

  return RunQuote (teller, args.timestamp,
    [&args] (BondTeller& t, Amount& res)
      {
        return t.CalculateAmountIn (args.amount, args.stake, res);
      });
}

std::string
BondsRpcServer::predicttelleraddress (const std::string& depository,
                                      const std::string& salt)
{
  LOG (INFO)
      << "RPC method called: predicttelleraddress " << depository
      << " " << salt;

  const Json::Value res = logic.GetCustomStateData (game,
    [&] (Database& db, const xaya::uint256& hash, const unsigned height)
      {
        const Context ctx(logic.GetChain (), height + 1,
                          Context::NO_TIMESTAMP);
        Ledger ledger(db, ctx);
        BondDepository depo(db, ctx, ledger, depository);

        const std::string addr = depo.PredictTellerAddress (salt);
        if (addr.empty ())
          ReturnError (RpcErrorCode::UNKNOWN_DEPOSITORY,
                       "unknown depository: " + depository);

        return Json::Value (addr);
      });

  /* GetCustomStateData wraps the result together with the block hash
     and height.  */
  CHECK (res.isObject ());
  const auto& data = res["data"];
  CHECK (data.isString ());
  return data.asString ();
}

/* ************************************************************************** */

} // namespace bonds
