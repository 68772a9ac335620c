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

#include "moveprocessor.hpp"

#include "bonddepository.hpp"
#include "errors.hpp"
#include "jsonutils.hpp"
#include "lockvault.hpp"

#include "proto/teller.pb.h"

#include <xayautil/jsonutils.hpp>

#include <glog/logging.h>

#include <set>

namespace bonds
{

namespace
{

/**
 * Executes one call inside its own savepoint.  The changes are kept
 * only if the call succeeds.
 */
template <typename Fcn>
  void
  RunCall (Database& db, const std::string& name, const std::string& what,
           const Fcn& call)
{
  Savepoint sp(db, "call");
  const ErrorCode err = call ();
  if (err == ErrorCode::OK)
    {
      VLOG (1) << what << " by " << name << " succeeded";
      sp.Commit ();
      return;
    }

  LOG (WARNING) << what << " by " << name << " failed: " << err;
}

/**
 * Possible governance actions in a "gov" command.
 */
enum class GovAction
{
  INVALID,
  PROPOSE,
  ACCEPT,
};

/**
 * Parses a governance command, which is either {"propose": address}
 * or {"accept": true}.  Extra fields (like the asset for ledger
 * commands) are ignored.
 */
GovAction
ParseGovernance (const Json::Value& cmd, std::string& pending)
{
  if (!cmd.isObject ())
    return GovAction::INVALID;

  const bool propose = cmd.isMember ("propose");
  const bool accept = cmd.isMember ("accept");
  if (propose == accept)
    return GovAction::INVALID;

  if (propose)
    return AddressFromJson (cmd["propose"], pending)
              ? GovAction::PROPOSE : GovAction::INVALID;

  const auto& val = cmd["accept"];
  if (!val.isBool () || !val.asBool ())
    return GovAction::INVALID;
  return GovAction::ACCEPT;
}

/**
 * Parses the addresses of a setAddresses command.
 */
bool
ParseAddresses (const Json::Value& cmd, std::string& reward,
                std::string& lockVault, std::string& pool, std::string& dao)
{
  if (!cmd.isObject () || cmd.size () != 4)
    return false;

  return AddressFromJson (cmd["reward"], reward)
          && AddressFromJson (cmd["lockvault"], lockVault)
          && AddressFromJson (cmd["pool"], pool)
          && AddressFromJson (cmd["dao"], dao);
}

/**
 * Parses the sale terms for a teller.
 */
bool
ParseTerms (const Json::Value& cmd, proto::TellerTerms& terms)
{
  if (!cmd.isObject () || cmd.size () != 11)
    return false;

  Amount startPrice, minPrice, maxPayout, adjNum, adjDenom, capacity;
  if (!AssetAmountFromJson (cmd["startprice"], startPrice)
        || !AssetAmountFromJson (cmd["minimumprice"], minPrice)
        || !AssetAmountFromJson (cmd["maxpayout"], maxPayout)
        || !AssetAmountFromJson (cmd["priceadjnum"], adjNum)
        || !AssetAmountFromJson (cmd["priceadjdenom"], adjDenom)
        || !AssetAmountFromJson (cmd["capacity"], capacity))
    return false;

  int64_t startTime, endTime, vestingTerm, halfLife;
  if (!TimeFromJson (cmd["starttime"], startTime)
        || !TimeFromJson (cmd["endtime"], endTime)
        || !TimeFromJson (cmd["vestingterm"], vestingTerm)
        || !TimeFromJson (cmd["halflife"], halfLife))
    return false;

  const auto& capIsPayout = cmd["capacityispayout"];
  if (!capIsPayout.isBool ())
    return false;

  terms.Clear ();
  terms.set_start_price (startPrice);
  terms.set_minimum_price (minPrice);
  terms.set_max_payout (maxPayout);
  terms.set_price_adj_num (adjNum);
  terms.set_price_adj_denom (adjDenom);
  terms.set_capacity (capacity);
  terms.set_capacity_is_payout (capIsPayout.asBool ());
  terms.set_start_time (startTime);
  terms.set_end_time (endTime);
  terms.set_global_vesting_term (vestingTerm);
  terms.set_half_life (halfLife);

  return true;
}

/**
 * Parses the options of a deposit.  The amount is only parsed if
 * withAmount is true (it is not for native deposits, where it is
 * given by the payment).  The recipient defaults to the sender.
 */
bool
ParseDepositOptions (const Json::Value& cmd, const std::string& name,
                     const bool withAmount, DepositOptions& opt)
{
  if (!cmd.isObject ())
    return false;

  if (withAmount && !AssetAmountFromJson (cmd["amount"], opt.amount))
    return false;

  opt.minAmountOut = 0;
  if (cmd.isMember ("minout")
        && !AssetAmountFromJson (cmd["minout"], opt.minAmountOut))
    return false;

  opt.recipient = name;
  if (cmd.isMember ("recipient")
        && !AddressFromJson (cmd["recipient"], opt.recipient))
    return false;

  opt.stake = false;
  if (cmd.isMember ("stake"))
    {
      const auto& stake = cmd["stake"];
      if (!stake.isBool ())
        return false;
      opt.stake = stake.asBool ();
    }

  return true;
}

/**
 * Parses the data of a teller-creation command.
 */
bool
ParseTellerCreation (const Json::Value& cmd, proto::TellerConfig& init,
                     std::string& governance, std::string& salt)
{
  if (!cmd.isObject ())
    return false;

  const auto& name = cmd["name"];
  if (!name.isString ())
    return false;
  init.set_name (name.asString ());

  std::string principal;
  if (!AddressFromJson (cmd["governance"], governance)
        || !AddressFromJson (cmd["principal"], principal))
    return false;
  init.set_principal (principal);

  init.set_permittable (false);
  if (cmd.isMember ("permittable"))
    {
      const auto& val = cmd["permittable"];
      if (!val.isBool ())
        return false;
      init.set_permittable (val.asBool ());
    }

  init.set_kind (proto::TellerConfig::ERC20);
  if (cmd.isMember ("kind"))
    {
      const auto& kind = cmd["kind"];
      if (!kind.isString ())
        return false;
      if (kind.asString () == "native")
        init.set_kind (proto::TellerConfig::NATIVE);
      else if (kind.asString () != "erc20")
        return false;
    }

  std::string receiver;
  if (cmd.isMember ("receiver")
        && !AddressFromJson (cmd["receiver"], receiver))
    return false;
  init.set_receiver (receiver);

  salt.clear ();
  if (cmd.isMember ("salt") && !AddressFromJson (cmd["salt"], salt))
    return false;

  return true;
}

/**
 * Parses an {"id": ..., "to": ...} command for bonds and locks.
 */
bool
ParseIdAndAddress (const Json::Value& cmd, Database::IdT& id,
                   std::string& to)
{
  if (!cmd.isObject () || cmd.size () != 2)
    return false;

  return IdFromJson (cmd["id"], id) && AddressFromJson (cmd["to"], to);
}

/**
 * Parses an {"asset": ..., <key>: address, "amount": ...} command as used
 * for transfers, approvals and minting.
 */
bool
ParseLedgerCommand (const Json::Value& cmd, const std::string& key,
                    std::string& asset, std::string& addr, Amount& amount)
{
  if (!cmd.isObject () || cmd.size () != 3)
    return false;

  return AddressFromJson (cmd["asset"], asset)
          && AddressFromJson (cmd[key], addr)
          && AssetAmountFromJson (cmd["amount"], amount);
}

} // anonymous namespace

MoveProcessor::MoveProcessor (Database& d, const Context& c)
  : ctx(c), db(d), ledger(db, ctx), tellers(db)
{}

bool
MoveProcessor::ExtractMoveBasics (const Json::Value& moveObj,
                                  std::string& name, Json::Value& mv) const
{
  VLOG (1) << "Processing move:\n" << moveObj;
  CHECK (moveObj.isObject ());

  const auto& nameVal = moveObj["name"];
  CHECK (nameVal.isString ());
  name = nameVal.asString ();

  if (name.empty () || name[0] == '@')
    {
      LOG (WARNING) << "Ignoring move from reserved name " << name;
      return false;
    }

  CHECK (moveObj.isMember ("move"));
  mv = moveObj["move"];
  if (!mv.isObject ())
    {
      /* Payments to native tellers are still processed as implicit
         deposits, so we go on with an empty move.  */
      LOG (WARNING) << "Move is not an object: " << mv;
      mv = Json::Value (Json::objectValue);
    }

  return true;
}

void
MoveProcessor::ProcessAll (const Json::Value& moveArray)
{
  CHECK (moveArray.isArray ());
  LOG (INFO) << "Processing " << moveArray.size () << " moves...";

  for (const auto& m : moveArray)
    ProcessOne (m);
}

void
MoveProcessor::ProcessOne (const Json::Value& moveObj)
{
  std::string name;
  Json::Value mv;
  if (!ExtractMoveBasics (moveObj, name, mv))
    return;

  /* Ledger operations come first, so that e.g. an approval and the
     deposit spending it can be sent in a single move.  */
  TryLedgerOperations (name, mv["a"]);
  TryDepositoryOperations (name, mv["d"]);
  TryTellerOperations (name, mv["t"]);
  TryLockVaultOperations (name, mv["l"]);

  TryNativeDeposits (name, mv, moveObj["out"]);
}

/* ************************************************************************** */

void
MoveProcessor::TryLedgerOperations (const std::string& name,
                                    const Json::Value& cmd)
{
  if (!cmd.isObject ())
    return;

  std::string asset, addr;
  Amount amount;

  if (cmd.isMember ("transfer"))
    {
      if (ParseLedgerCommand (cmd["transfer"], "to", asset, addr, amount))
        RunCall (db, name, "Transfer", [&] ()
          {
            return ledger.Transfer (name, addr, asset, amount);
          });
      else
        LOG (WARNING) << "Invalid transfer: " << cmd["transfer"];
    }

  if (cmd.isMember ("approve"))
    {
      if (ParseLedgerCommand (cmd["approve"], "spender", asset, addr, amount))
        RunCall (db, name, "Approval", [&] ()
          {
            return ledger.Approve (name, addr, asset, amount);
          });
      else
        LOG (WARNING) << "Invalid approval: " << cmd["approve"];
    }

  if (cmd.isMember ("mint"))
    {
      if (ParseLedgerCommand (cmd["mint"], "to", asset, addr, amount))
        RunCall (db, name, "Minting", [&] ()
          {
            return ledger.Mint (name, addr, asset, amount);
          });
      else
        LOG (WARNING) << "Invalid mint: " << cmd["mint"];
    }

  if (cmd.isMember ("minter"))
    {
      const auto& minter = cmd["minter"];
      const bool add = minter.isObject () && minter.isMember ("add");
      const bool remove = minter.isObject () && minter.isMember ("remove");
      if (minter.isObject () && minter.size () == 2 && add != remove
            && AddressFromJson (minter["asset"], asset)
            && AddressFromJson (minter[add ? "add" : "remove"], addr))
        {
          if (add)
            RunCall (db, name, "Adding minter", [&] ()
              {
                return ledger.AddMinter (name, asset, addr);
              });
          else
            RunCall (db, name, "Removing minter", [&] ()
              {
                return ledger.RemoveMinter (name, asset, addr);
              });
        }
      else
        LOG (WARNING) << "Invalid minter command: " << minter;
    }

  if (cmd.isMember ("gov"))
    {
      const auto& gov = cmd["gov"];
      std::string pending;
      const GovAction action = ParseGovernance (gov, pending);
      if (action == GovAction::INVALID
            || !AddressFromJson (gov["asset"], asset))
        LOG (WARNING) << "Invalid asset governance command: " << gov;
      else if (action == GovAction::PROPOSE)
        RunCall (db, name, "Asset governance proposal", [&] ()
          {
            return ledger.SetPendingGovernance (name, asset, pending);
          });
      else
        RunCall (db, name, "Asset governance acceptance", [&] ()
          {
            return ledger.AcceptGovernance (name, asset);
          });
    }
}

/* ************************************************************************** */

void
MoveProcessor::TryDepositoryOperations (const std::string& name,
                                        const Json::Value& cmd)
{
  if (!cmd.isObject ())
    return;

  for (auto it = cmd.begin (); it != cmd.end (); ++it)
    {
      CHECK (it.key ().isString ());
      if (!it->isObject ())
        {
          LOG (WARNING) << "Invalid depository update: " << *it;
          continue;
        }
      TryDepositoryUpdate (name, it.key ().asString (), *it);
    }
}

void
MoveProcessor::TryDepositoryUpdate (const std::string& name,
                                    const std::string& address,
                                    const Json::Value& upd)
{
  BondDepository depo(db, ctx, ledger, address);

  if (upd.isMember ("gov"))
    {
      std::string pending;
      switch (ParseGovernance (upd["gov"], pending))
        {
        case GovAction::PROPOSE:
          RunCall (db, name, "Depository governance proposal", [&] ()
            {
              return depo.SetPendingGovernance (name, pending);
            });
          break;
        case GovAction::ACCEPT:
          RunCall (db, name, "Depository governance acceptance", [&] ()
            {
              return depo.AcceptGovernance (name);
            });
          break;
        case GovAction::INVALID:
          LOG (WARNING) << "Invalid governance command: " << upd["gov"];
          break;
        }
    }

  std::string teller;
  if (upd.isMember ("addteller"))
    {
      if (AddressFromJson (upd["addteller"], teller))
        RunCall (db, name, "Adding teller", [&] ()
          {
            return depo.AddTeller (name, teller);
          });
      else
        LOG (WARNING) << "Invalid addteller: " << upd["addteller"];
    }
  if (upd.isMember ("removeteller"))
    {
      if (AddressFromJson (upd["removeteller"], teller))
        RunCall (db, name, "Removing teller", [&] ()
          {
            return depo.RemoveTeller (name, teller);
          });
      else
        LOG (WARNING) << "Invalid removeteller: " << upd["removeteller"];
    }

  if (upd.isMember ("addresses"))
    {
      std::string reward, lockVault, pool, dao;
      if (ParseAddresses (upd["addresses"], reward, lockVault, pool, dao))
        RunCall (db, name, "Setting depository addresses", [&] ()
          {
            return depo.SetAddresses (name, reward, lockVault, pool, dao);
          });
      else
        LOG (WARNING) << "Invalid addresses: " << upd["addresses"];
    }

  if (upd.isMember ("create"))
    {
      proto::TellerConfig init;
      std::string governance, salt, created;
      if (ParseTellerCreation (upd["create"], init, governance, salt))
        RunCall (db, name, "Teller creation", [&] ()
          {
            return depo.CreateTeller (name, init, governance, salt, created);
          });
      else
        LOG (WARNING) << "Invalid teller creation: " << upd["create"];
    }

  if (upd.isMember ("pull"))
    {
      const auto& pull = upd["pull"];
      Amount amount;
      if (pull.isObject () && pull.size () == 1
            && AssetAmountFromJson (pull["amount"], amount))
        RunCall (db, name, "Reward pull", [&] ()
          {
            return depo.PullReward (name, amount);
          });
      else
        LOG (WARNING) << "Invalid pull: " << pull;
    }
}

/* ************************************************************************** */

void
MoveProcessor::TryTellerOperations (const std::string& name,
                                    const Json::Value& cmd)
{
  if (!cmd.isObject ())
    return;

  for (auto it = cmd.begin (); it != cmd.end (); ++it)
    {
      CHECK (it.key ().isString ());
      if (!it->isObject ())
        {
          LOG (WARNING) << "Invalid teller update: " << *it;
          continue;
        }

      BondTeller teller(db, ctx, ledger, it.key ().asString ());
      TryTellerUpdate (name, teller, *it);
    }
}

void
MoveProcessor::TryTellerUpdate (const std::string& name, BondTeller& teller,
                                const Json::Value& upd)
{
  if (upd.isMember ("gov"))
    {
      std::string pending;
      switch (ParseGovernance (upd["gov"], pending))
        {
        case GovAction::PROPOSE:
          RunCall (db, name, "Teller governance proposal", [&] ()
            {
              return teller.SetPendingGovernance (name, pending);
            });
          break;
        case GovAction::ACCEPT:
          RunCall (db, name, "Teller governance acceptance", [&] ()
            {
              return teller.AcceptGovernance (name);
            });
          break;
        case GovAction::INVALID:
          LOG (WARNING) << "Invalid governance command: " << upd["gov"];
          break;
        }
    }

  if (upd.isMember ("addresses"))
    {
      std::string reward, lockVault, pool, dao;
      if (ParseAddresses (upd["addresses"], reward, lockVault, pool, dao))
        RunCall (db, name, "Setting teller addresses", [&] ()
          {
            return teller.SetAddresses (name, reward, lockVault, pool, dao);
          });
      else
        LOG (WARNING) << "Invalid addresses: " << upd["addresses"];
    }

  if (upd.isMember ("fees"))
    {
      const auto& fees = upd["fees"];
      if (fees.isInt64 () && xaya::IsIntegerValue (fees))
        RunCall (db, name, "Setting fees", [&] ()
          {
            return teller.SetFees (name, fees.asInt64 ());
          });
      else
        LOG (WARNING) << "Invalid fees: " << fees;
    }

  if (upd.isMember ("terms"))
    {
      proto::TellerTerms terms;
      if (ParseTerms (upd["terms"], terms))
        RunCall (db, name, "Setting terms", [&] ()
          {
            return teller.SetTerms (name, terms);
          });
      else
        LOG (WARNING) << "Invalid terms: " << upd["terms"];
    }

  if (upd.isMember ("pause"))
    {
      const auto& pause = upd["pause"];
      if (pause.isBool ())
        RunCall (db, name, pause.asBool () ? "Pausing" : "Unpausing", [&] ()
          {
            return teller.SetPaused (name, pause.asBool ());
          });
      else
        LOG (WARNING) << "Invalid pause: " << pause;
    }

  if (upd.isMember ("approveall"))
    {
      const auto& cmd = upd["approveall"];
      std::string op;
      if (cmd.isObject () && cmd.size () == 2
            && AddressFromJson (cmd["operator"], op)
            && cmd["approved"].isBool ())
        RunCall (db, name, "Operator approval", [&] ()
          {
            return teller.SetApprovalForAll (name, op,
                                             cmd["approved"].asBool ());
          });
      else
        LOG (WARNING) << "Invalid approveall: " << cmd;
    }

  Database::IdT id;
  std::string to;

  if (upd.isMember ("approve"))
    {
      if (ParseIdAndAddress (upd["approve"], id, to))
        RunCall (db, name, "Bond approval", [&] ()
          {
            return teller.Approve (name, id, to);
          });
      else
        LOG (WARNING) << "Invalid bond approval: " << upd["approve"];
    }

  if (upd.isMember ("transfer"))
    {
      if (ParseIdAndAddress (upd["transfer"], id, to))
        RunCall (db, name, "Bond transfer", [&] ()
          {
            return teller.TransferBond (name, id, to);
          });
      else
        LOG (WARNING) << "Invalid bond transfer: " << upd["transfer"];
    }

  if (upd.isMember ("claim"))
    {
      if (IdFromJson (upd["claim"], id))
        RunCall (db, name, "Claim", [&] ()
          {
            Amount claimed;
            return teller.ClaimPayout (name, id, claimed);
          });
      else
        LOG (WARNING) << "Invalid claim: " << upd["claim"];
    }

  DepositOptions opt;
  DepositResult res;

  if (upd.isMember ("deposit"))
    {
      if (ParseDepositOptions (upd["deposit"], name, true, opt))
        RunCall (db, name, "Deposit", [&] ()
          {
            return teller.Deposit (name, opt, res);
          });
      else
        LOG (WARNING) << "Invalid deposit: " << upd["deposit"];
    }

  if (upd.isMember ("depositsigned"))
    {
      const auto& cmd = upd["depositsigned"];
      Amount permitAmount;
      int64_t deadline;
      if (ParseDepositOptions (cmd, name, true, opt)
            && cmd["permit"].isObject () && cmd["permit"].size () == 2
            && AssetAmountFromJson (cmd["permit"]["amount"], permitAmount)
            && TimeFromJson (cmd["permit"]["deadline"], deadline))
        RunCall (db, name, "Signed deposit", [&] ()
          {
            return teller.DepositSigned (name, opt, permitAmount, deadline,
                                         res);
          });
      else
        LOG (WARNING) << "Invalid signed deposit: " << cmd;
    }
}

/* ************************************************************************** */

void
MoveProcessor::TryLockVaultOperations (const std::string& name,
                                       const Json::Value& cmd)
{
  if (!cmd.isObject ())
    return;

  for (auto it = cmd.begin (); it != cmd.end (); ++it)
    {
      CHECK (it.key ().isString ());
      const auto& upd = *it;
      if (!upd.isObject ())
        {
          LOG (WARNING) << "Invalid lock vault update: " << upd;
          continue;
        }

      LockVault vault(db, ctx, ledger, it.key ().asString ());

      if (upd.isMember ("create"))
        {
          const auto& create = upd["create"];
          std::string asset;
          Amount amount;
          int64_t end;
          if (create.isObject () && create.size () == 3
                && AddressFromJson (create["asset"], asset)
                && AssetAmountFromJson (create["amount"], amount)
                && TimeFromJson (create["end"], end))
            RunCall (db, name, "Lock creation", [&] ()
              {
                Database::IdT lockId;
                return vault.CreateLock (name, name, asset, amount, end,
                                         lockId);
              });
          else
            LOG (WARNING) << "Invalid lock creation: " << create;
        }

      if (upd.isMember ("withdraw"))
        {
          Database::IdT id;
          std::string to;
          if (ParseIdAndAddress (upd["withdraw"], id, to))
            RunCall (db, name, "Lock withdrawal", [&] ()
              {
                return vault.Withdraw (name, id, to);
              });
          else
            LOG (WARNING) << "Invalid withdrawal: " << upd["withdraw"];
        }
    }
}

/* ************************************************************************** */

void
MoveProcessor::TryNativeDeposits (const std::string& name,
                                  const Json::Value& mv,
                                  const Json::Value& out)
{
  const auto& tellerCmds = mv["t"];
  std::set<std::string> paid;

  if (out.isObject ())
    for (auto it = out.begin (); it != out.end (); ++it)
      {
        CHECK (it.key ().isString ());
        const std::string receiver = it.key ().asString ();

        std::string address;
        {
          auto t = tellers.GetByReceiver (receiver);
          if (t == nullptr)
            continue;
          address = t->GetAddress ();
        }

        DepositOptions opt;
        CHECK (xaya::ChiAmountFromJson (*it, opt.amount))
            << "Invalid payment amount: " << *it;

        opt.recipient = name;
        if (tellerCmds.isObject () && tellerCmds[address].isObject ()
              && tellerCmds[address].isMember ("depositnative"))
          {
            const auto& cmd = tellerCmds[address]["depositnative"];
            if (!ParseDepositOptions (cmd, name, false, opt))
              {
                LOG (WARNING)
                    << "Invalid native deposit options, using defaults: "
                    << cmd;
                opt.minAmountOut = 0;
                opt.recipient = name;
                opt.stake = false;
              }
          }
        paid.insert (address);

        LOG (INFO)
            << name << " paid " << opt.amount << " to native teller "
            << address;

        BondTeller teller(db, ctx, ledger, address);
        DepositResult res;
        const ErrorCode err = teller.DepositNative (name, opt, res);
        if (err == ErrorCode::OK)
          VLOG (1) << "Native deposit by " << name << " succeeded";
      }

  if (!tellerCmds.isObject ())
    return;
  for (auto it = tellerCmds.begin (); it != tellerCmds.end (); ++it)
    if (it->isObject () && it->isMember ("depositnative")
          && paid.count (it.key ().asString ()) == 0)
      LOG (WARNING)
          << "Native deposit command by " << name << " without payment to "
          << it.key ().asString ();
}

} // namespace bonds
