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

#include "bondteller.hpp"

#include "bonddepository.hpp"
#include "governance.hpp"
#include "lockvault.hpp"
#include "pricing.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace bonds
{

namespace
{

/** Denominator for basis points.  */
constexpr int64_t MAX_BPS = 10'000;

/**
 * Computes how much of a bond's payout has vested at the given time.
 */
Amount
VestedAmount (const Bond& b, const int64_t now)
{
  const int64_t elapsed = now - b.GetVestingStart ();
  if (b.GetVestingTerm () == 0 || elapsed >= b.GetVestingTerm ())
    return b.GetPayout ();
  if (elapsed <= 0)
    return 0;

  const __int128 vested
      = static_cast<__int128> (b.GetPayout ()) * elapsed / b.GetVestingTerm ();
  return static_cast<Amount> (vested);
}

Json::Value
TermsToJson (const proto::TellerTerms& terms)
{
  Json::Value res(Json::objectValue);
  res["startprice"] = static_cast<Json::Int64> (terms.start_price ());
  res["minimumprice"] = static_cast<Json::Int64> (terms.minimum_price ());
  res["maxpayout"] = static_cast<Json::Int64> (terms.max_payout ());
  res["priceadjnum"] = static_cast<Json::Int64> (terms.price_adj_num ());
  res["priceadjdenom"] = static_cast<Json::Int64> (terms.price_adj_denom ());
  res["capacity"] = static_cast<Json::Int64> (terms.capacity ());
  res["capacityispayout"] = terms.capacity_is_payout ();
  res["starttime"] = static_cast<Json::Int64> (terms.start_time ());
  res["endtime"] = static_cast<Json::Int64> (terms.end_time ());
  res["globalvestingterm"]
      = static_cast<Json::Int64> (terms.global_vesting_term ());
  res["halflife"] = static_cast<Json::Int64> (terms.half_life ());
  return res;
}

} // anonymous namespace

BondTeller::BondTeller (Database& d, const Context& c, Ledger& l,
                        const std::string& addr)
  : address(addr), db(d), ctx(c), ledger(l),
    events(db, ctx.Height ()), tellers(db), registry(db)
{}

/* ************************************************************************** */

ErrorCode
BondTeller::SetTerms (const std::string& caller,
                      const proto::TellerTerms& terms)
{
  auto t = tellers.GetByAddress (address);
  if (t == nullptr)
    return ErrorCode::UNKNOWN_TELLER;

  GovernanceRecord gov(*t->MutableProto ().mutable_governance (),
                       events, address);
  const ErrorCode err = gov.RequireGovernance (caller);
  if (err != ErrorCode::OK)
    return err;

  CHECK_GE (terms.minimum_price (), 0);
  CHECK_GE (terms.max_payout (), 0);
  CHECK_GE (terms.price_adj_num (), 0);
  CHECK_GE (terms.price_adj_denom (), 0);
  CHECK_GE (terms.capacity (), 0);
  CHECK_GE (terms.global_vesting_term (), 0);

  if (terms.start_price () <= 0)
    return ErrorCode::INVALID_PRICE;
  if (terms.price_adj_denom () == 0)
    return ErrorCode::ZERO_DENOMINATOR;
  if (terms.start_time () > terms.end_time ())
    return ErrorCode::INVALID_DATES;
  if (terms.half_life () <= 0)
    return ErrorCode::INVALID_HALF_LIFE;

  LOG (INFO) << "Setting terms of teller " << address;

  auto& pb = t->MutableProto ();
  *pb.mutable_terms () = terms;
  pb.set_next_price (terms.start_price ());
  pb.set_last_price_update (ctx.Timestamp ());

  events.Emit (address, "TermsSet", TermsToJson (terms));

  return ErrorCode::OK;
}

ErrorCode
BondTeller::SetFees (const std::string& caller, const int64_t protocolFeeBps)
{
  auto t = tellers.GetByAddress (address);
  if (t == nullptr)
    return ErrorCode::UNKNOWN_TELLER;

  GovernanceRecord gov(*t->MutableProto ().mutable_governance (),
                       events, address);
  const ErrorCode err = gov.RequireGovernance (caller);
  if (err != ErrorCode::OK)
    return err;

  if (protocolFeeBps < 0 || protocolFeeBps > MAX_BPS)
    return ErrorCode::INVALID_FEE;

  t->MutableProto ().set_protocol_fee_bps (protocolFeeBps);

  Json::Value args(Json::objectValue);
  args["protocolfee"] = static_cast<Json::Int64> (protocolFeeBps);
  events.Emit (address, "FeesSet", args);

  return ErrorCode::OK;
}

ErrorCode
BondTeller::SetPaused (const std::string& caller, const bool paused)
{
  auto t = tellers.GetByAddress (address);
  if (t == nullptr)
    return ErrorCode::UNKNOWN_TELLER;

  GovernanceRecord gov(*t->MutableProto ().mutable_governance (),
                       events, address);
  const ErrorCode err = gov.RequireGovernance (caller);
  if (err != ErrorCode::OK)
    return err;

  t->MutableProto ().set_paused (paused);
  events.Emit (address, paused ? "Paused" : "Unpaused",
               Json::Value (Json::objectValue));

  return ErrorCode::OK;
}

ErrorCode
BondTeller::SetAddresses (const std::string& caller,
                          const std::string& reward,
                          const std::string& lockVault,
                          const std::string& pool, const std::string& dao)
{
  auto t = tellers.GetByAddress (address);
  if (t == nullptr)
    return ErrorCode::UNKNOWN_TELLER;

  GovernanceRecord gov(*t->MutableProto ().mutable_governance (),
                       events, address);
  const ErrorCode err = gov.RequireGovernance (caller);
  if (err != ErrorCode::OK)
    return err;

  if (reward.empty ())
    return ErrorCode::ZERO_ADDRESS_REWARD;
  if (lockVault.empty ())
    return ErrorCode::ZERO_ADDRESS_LOCK_VAULT;
  if (pool.empty ())
    return ErrorCode::ZERO_ADDRESS_POOL;
  if (dao.empty ())
    return ErrorCode::ZERO_ADDRESS_DAO;
  if (!ledger.AssetExists (reward))
    return ErrorCode::UNKNOWN_ASSET;

  auto& cfg = *t->MutableProto ().mutable_config ();
  cfg.set_reward (reward);
  cfg.set_lock_vault (lockVault);
  cfg.set_pool (pool);
  cfg.set_dao (dao);

  Json::Value args(Json::objectValue);
  args["reward"] = reward;
  args["lockvault"] = lockVault;
  args["pool"] = pool;
  args["dao"] = dao;
  events.Emit (address, "AddressesSet", args);

  return ErrorCode::OK;
}

ErrorCode
BondTeller::SetPendingGovernance (const std::string& caller,
                                  const std::string& pending)
{
  auto t = tellers.GetByAddress (address);
  if (t == nullptr)
    return ErrorCode::UNKNOWN_TELLER;

  GovernanceRecord gov(*t->MutableProto ().mutable_governance (),
                       events, address);
  return gov.SetPending (caller, pending);
}

ErrorCode
BondTeller::AcceptGovernance (const std::string& caller)
{
  auto t = tellers.GetByAddress (address);
  if (t == nullptr)
    return ErrorCode::UNKNOWN_TELLER;

  GovernanceRecord gov(*t->MutableProto ().mutable_governance (),
                       events, address);
  return gov.Accept (caller);
}

/* ************************************************************************** */

ErrorCode
BondTeller::CurrentPrice (Amount& price)
{
  auto t = tellers.GetByAddress (address);
  if (t == nullptr)
    return ErrorCode::UNKNOWN_TELLER;
  if (!t->HasTerms ())
    return ErrorCode::NOT_INITIALISED;

  price = bonds::CurrentPrice (t->GetProto (), ctx.Timestamp ());
  return ErrorCode::OK;
}

ErrorCode
BondTeller::CalculateAmountOut (const Amount amountIn, const bool stake,
                                Amount& payout)
{
  auto t = tellers.GetByAddress (address);
  if (t == nullptr)
    return ErrorCode::UNKNOWN_TELLER;

  return bonds::CalculateAmountOut (t->GetProto (), ctx.Timestamp (),
                                    amountIn, payout);
}

ErrorCode
BondTeller::CalculateAmountIn (const Amount amountOut, const bool stake,
                               Amount& amountIn)
{
  auto t = tellers.GetByAddress (address);
  if (t == nullptr)
    return ErrorCode::UNKNOWN_TELLER;

  return bonds::CalculateAmountIn (t->GetProto (), ctx.Timestamp (),
                                   amountOut, amountIn);
}

/* ************************************************************************** */

ErrorCode
BondTeller::DepositInternal (const std::string& depositor,
                             const bool pullWithAllowance,
                             const DepositOptions& opt, DepositResult& res)
{
  CHECK_GE (opt.amount, 0);
  CHECK_GE (opt.minAmountOut, 0);

  auto t = tellers.GetByAddress (address);
  if (t == nullptr)
    return ErrorCode::UNKNOWN_TELLER;

  const auto& pb = t->GetProto ();
  const int64_t now = ctx.Timestamp ();

  if (pb.paused ())
    return ErrorCode::PAUSED;
  if (!pb.has_terms ())
    return ErrorCode::NOT_INITIALISED;

  const auto& terms = pb.terms ();
  if (now < terms.start_time ())
    return ErrorCode::NOT_STARTED;
  if (now > terms.end_time ())
    return ErrorCode::CONCLUDED;

  const Amount price = bonds::CurrentPrice (pb, now);
  if (price == 0)
    return ErrorCode::INVALID_PRICE;

  const __int128 wide
      = static_cast<__int128> (opt.amount) * PRICE_PRECISION / price;
  const __int128 used = terms.capacity_is_payout () ? wide : opt.amount;
  if (used > terms.capacity ())
    return ErrorCode::AT_CAPACITY;
  if (wide > terms.max_payout ())
    return ErrorCode::TOO_LARGE;

  const Amount payout = static_cast<Amount> (wide);
  if (payout < opt.minAmountOut)
    return ErrorCode::SLIPPAGE;
  if (opt.recipient.empty ())
    return ErrorCode::INVALID_ADDRESS;
  if (payout == 0)
    return ErrorCode::ZERO_PAYOUT;

  VLOG (1)
      << "Deposit of " << opt.amount << " to teller " << address
      << " by " << depositor << " at price " << price
      << " for payout " << payout;

  /* Internal bookkeeping comes first.  */
  const proto::TellerConfig cfg = pb.config ();
  const int64_t vestingTerm = terms.global_vesting_term ();
  auto& mpb = t->MutableProto ();
  auto& mterms = *mpb.mutable_terms ();
  mterms.set_capacity (mterms.capacity () - static_cast<Amount> (used));
  mpb.set_next_price (AdjustedNextPrice (price, payout, mterms));
  mpb.set_last_price_update (now);

  /* Forward the principal to the DAO (protocol fee) and the pool.  */
  const Amount fee = static_cast<Amount> (
      static_cast<__int128> (opt.amount) * pb.protocol_fee_bps () / MAX_BPS);
  const Amount rest = opt.amount - fee;
  ErrorCode err;
  if (pullWithAllowance)
    {
      err = ledger.TransferFrom (address, depositor, cfg.dao (),
                                 cfg.principal (), fee);
      if (err == ErrorCode::OK)
        err = ledger.TransferFrom (address, depositor, cfg.pool (),
                                   cfg.principal (), rest);
    }
  else
    {
      err = ledger.Transfer (depositor, cfg.dao (), cfg.principal (), fee);
      if (err == ErrorCode::OK)
        err = ledger.Transfer (depositor, cfg.pool (), cfg.principal (), rest);
    }
  if (err != ErrorCode::OK)
    return err;

  BondDepository depo(db, ctx, ledger, cfg.depository ());
  err = depo.PullReward (address, payout);
  if (err != ErrorCode::OK)
    return err;

  res.payout = payout;

  if (opt.stake)
    {
      LockVault vault(db, ctx, ledger, cfg.lock_vault ());
      return vault.CreateLock (address, opt.recipient, cfg.reward (), payout,
                               now + vestingTerm, res.id);
    }

  res.id = mpb.num_bonds () + 1;
  mpb.set_num_bonds (res.id);
  registry.CreateNew (address, res.id, opt.recipient, opt.amount, payout,
                   now, vestingTerm);

  LOG (INFO)
      << "Teller " << address << " created bond " << res.id
      << " for " << opt.recipient << " with payout " << payout;

  Json::Value args(Json::objectValue);
  args["id"] = static_cast<Json::Int64> (res.id);
  args["owner"] = opt.recipient;
  args["principal"] = static_cast<Json::Int64> (opt.amount);
  args["payout"] = static_cast<Json::Int64> (payout);
  args["vestingstart"] = static_cast<Json::Int64> (now);
  args["vestingterm"] = static_cast<Json::Int64> (vestingTerm);
  events.Emit (address, "CreateBond", args);

  return ErrorCode::OK;
}

ErrorCode
BondTeller::Deposit (const std::string& caller, const DepositOptions& opt,
                     DepositResult& res)
{
  Savepoint sp(db, "deposit");
  const ErrorCode err = DepositInternal (caller, true, opt, res);
  if (err == ErrorCode::OK)
    sp.Commit ();
  return err;
}

ErrorCode
BondTeller::DepositSigned (const std::string& caller,
                           const DepositOptions& opt,
                           const Amount permitAmount, const int64_t deadline,
                           DepositResult& res)
{
  Savepoint sp(db, "deposit");

  std::string principal;
  {
    auto t = tellers.GetByAddress (address);
    if (t == nullptr)
      return ErrorCode::UNKNOWN_TELLER;
    if (!t->GetProto ().config ().permittable ())
      return ErrorCode::PERMIT_UNSUPPORTED;
    principal = t->GetProto ().config ().principal ();
  }

  ErrorCode err = ledger.Permit (caller, address, principal,
                                 permitAmount, deadline);
  if (err == ErrorCode::OK)
    err = DepositInternal (caller, true, opt, res);

  if (err == ErrorCode::OK)
    sp.Commit ();
  return err;
}

ErrorCode
BondTeller::DepositNative (const std::string& sender,
                           const DepositOptions& opt, DepositResult& res)
{
  std::string principal;
  {
    auto t = tellers.GetByAddress (address);
    CHECK (t != nullptr) << "Native deposit to unknown teller " << address;
    CHECK_EQ (t->GetProto ().config ().kind (), proto::TellerConfig::NATIVE)
        << "Teller " << address << " is not native";
    principal = t->GetProto ().config ().principal ();
  }

  ledger.Issue (sender, principal, opt.amount);

  Savepoint sp(db, "deposit");
  const ErrorCode err = DepositInternal (sender, false, opt, res);
  if (err == ErrorCode::OK)
    sp.Commit ();
  else
    LOG (WARNING)
        << "Native deposit of " << opt.amount << " by " << sender
        << " to " << address << " failed (" << err << "),"
        << " wrapped coins stay with the sender";

  return err;
}

/* ************************************************************************** */

bool
BondTeller::IsAuthorised (const Bond& b, const std::string& caller)
{
  if (caller.empty ())
    return false;
  if (caller == b.GetOwner () || caller == b.GetApproved ())
    return true;
  return registry.IsOperator (address, b.GetOwner (), caller);
}

ErrorCode
BondTeller::ClaimPayoutInternal (const std::string& caller,
                                 const Database::IdT bondId, Amount& claimed)
{
  auto t = tellers.GetByAddress (address);
  if (t == nullptr)
    return ErrorCode::UNKNOWN_TELLER;

  auto b = registry.GetById (address, bondId);
  if (b == nullptr)
    return ErrorCode::NONEXISTENT_TOKEN;
  if (!IsAuthorised (*b, caller))
    return ErrorCode::NOT_BONDER;

  /* Block timestamps are not strictly monotonic, so the vested amount
     can be below what was claimed already at an earlier block.  */
  const Amount vested = VestedAmount (*b, ctx.Timestamp ());
  claimed = std::max<Amount> (0, vested - b->GetClaimed ());

  b->AddClaimed (claimed);

  if (claimed > 0)
    {
      const ErrorCode err
          = ledger.Transfer (address, caller,
                             t->GetProto ().config ().reward (), claimed);
      if (err != ErrorCode::OK)
        return err;
    }

  Json::Value args(Json::objectValue);
  args["id"] = static_cast<Json::Int64> (bondId);
  args["recipient"] = caller;
  args["amount"] = static_cast<Json::Int64> (claimed);

  if (b->IsRedeemed ())
    {
      LOG (INFO) << "Bond " << bondId << " of " << address << " redeemed";
      events.Emit (address, "RedeemBond", args);
    }
  else
    events.Emit (address, "ClaimPayout", args);

  return ErrorCode::OK;
}

ErrorCode
BondTeller::ClaimPayout (const std::string& caller,
                         const Database::IdT bondId, Amount& claimed)
{
  Savepoint sp(db, "claim");
  const ErrorCode err = ClaimPayoutInternal (caller, bondId, claimed);
  if (err == ErrorCode::OK)
    sp.Commit ();
  return err;
}

ErrorCode
BondTeller::Approve (const std::string& caller, const Database::IdT bondId,
                     const std::string& approved)
{
  auto b = registry.GetById (address, bondId);
  if (b == nullptr)
    return ErrorCode::NONEXISTENT_TOKEN;

  if (caller != b->GetOwner ()
        && !registry.IsOperator (address, b->GetOwner (), caller))
    return ErrorCode::NOT_BONDER;

  b->SetApproved (approved);
  return ErrorCode::OK;
}

ErrorCode
BondTeller::SetApprovalForAll (const std::string& caller,
                               const std::string& op, const bool approved)
{
  if (op.empty () || op == caller)
    return ErrorCode::INVALID_ADDRESS;

  registry.SetOperator (address, caller, op, approved);
  return ErrorCode::OK;
}

ErrorCode
BondTeller::TransferBond (const std::string& caller,
                          const Database::IdT bondId, const std::string& to)
{
  auto b = registry.GetById (address, bondId);
  if (b == nullptr)
    return ErrorCode::NONEXISTENT_TOKEN;
  if (!IsAuthorised (*b, caller))
    return ErrorCode::NOT_BONDER;
  if (to.empty ())
    return ErrorCode::INVALID_ADDRESS;

  Json::Value args(Json::objectValue);
  args["id"] = static_cast<Json::Int64> (bondId);
  args["from"] = b->GetOwner ();
  args["to"] = to;
  events.Emit (address, "TransferBond", args);

  b->SetOwner (to);
  return ErrorCode::OK;
}

} // namespace bonds
