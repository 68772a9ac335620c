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

#include "ledger.hpp"

#include "governance.hpp"

#include <glog/logging.h>

namespace bonds
{

Ledger::Ledger (Database& d, const Context& c)
  : db(d), ctx(c), events(db, ctx.Height ()),
    assets(db), balances(db), supply(db)
{}

void
Ledger::RegisterAsset (const proto::AssetConfig& cfg)
{
  LOG (INFO) << "Registering asset " << cfg.name ();
  CHECK_NE (cfg.name (), "");

  auto a = assets.CreateNew (cfg.name ());
  auto& pb = a->MutableProto ();
  if (!cfg.governance ().empty ())
    GovernanceRecord::Initialise (*pb.mutable_governance (), cfg.governance ());
  pb.set_permit (cfg.permit ());
  pb.set_native (cfg.native ());

  supply.InitialiseAsset (cfg.name ());
  for (const auto& m : cfg.minters ())
    assets.AddMinter (cfg.name (), m);
}

bool
Ledger::AssetExists (const std::string& asset)
{
  return assets.GetByName (asset) != nullptr;
}

bool
Ledger::IsNative (const std::string& asset)
{
  auto a = assets.GetByName (asset);
  return a != nullptr && a->GetProto ().native ();
}

bool
Ledger::SupportsPermit (const std::string& asset)
{
  auto a = assets.GetByName (asset);
  return a != nullptr && a->GetProto ().permit ();
}

Amount
Ledger::GetBalance (const std::string& account, const std::string& asset)
{
  return balances.Get (account, asset);
}

Amount
Ledger::GetAllowance (const std::string& owner, const std::string& spender,
                      const std::string& asset)
{
  return balances.GetAllowance (owner, spender, asset);
}

void
Ledger::Move (const std::string& from, const std::string& to,
              const std::string& asset, const Amount amount)
{
  CHECK_GE (amount, 0);
  if (amount == 0 || from == to)
    return;

  balances.Add (from, asset, -amount);
  balances.Add (to, asset, amount);
}

ErrorCode
Ledger::Transfer (const std::string& from, const std::string& to,
                  const std::string& asset, const Amount amount)
{
  if (!AssetExists (asset))
    return ErrorCode::UNKNOWN_ASSET;
  if (to.empty ())
    return ErrorCode::INVALID_ADDRESS;
  if (balances.Get (from, asset) < amount)
    return ErrorCode::INSUFFICIENT_BALANCE;

  VLOG (1)
      << "Transferring " << amount << " " << asset
      << " from " << from << " to " << to;
  Move (from, to, asset, amount);

  return ErrorCode::OK;
}

ErrorCode
Ledger::TransferFrom (const std::string& spender, const std::string& from,
                      const std::string& to, const std::string& asset,
                      const Amount amount)
{
  if (!AssetExists (asset))
    return ErrorCode::UNKNOWN_ASSET;

  const Amount allowance = balances.GetAllowance (from, spender, asset);
  if (allowance < amount)
    return ErrorCode::INSUFFICIENT_ALLOWANCE;

  const ErrorCode err = Transfer (from, to, asset, amount);
  if (err != ErrorCode::OK)
    return err;

  balances.SetAllowance (from, spender, asset, allowance - amount);
  return ErrorCode::OK;
}

ErrorCode
Ledger::Approve (const std::string& owner, const std::string& spender,
                 const std::string& asset, const Amount amount)
{
  if (!AssetExists (asset))
    return ErrorCode::UNKNOWN_ASSET;
  if (spender.empty ())
    return ErrorCode::INVALID_ADDRESS;

  balances.SetAllowance (owner, spender, asset, amount);
  return ErrorCode::OK;
}

ErrorCode
Ledger::Permit (const std::string& owner, const std::string& spender,
                const std::string& asset, const Amount amount,
                const int64_t deadline)
{
  if (!SupportsPermit (asset))
    return ErrorCode::PERMIT_UNSUPPORTED;
  if (deadline < ctx.Timestamp ())
    return ErrorCode::PERMIT_EXPIRED;

  return Approve (owner, spender, asset, amount);
}

ErrorCode
Ledger::Mint (const std::string& minter, const std::string& to,
              const std::string& asset, const Amount amount)
{
  if (!AssetExists (asset))
    return ErrorCode::UNKNOWN_ASSET;
  if (!assets.IsMinter (asset, minter))
    return ErrorCode::NOT_MINTER;
  if (to.empty ())
    return ErrorCode::INVALID_ADDRESS;
  if (amount > MAX_AMOUNT - supply.Get (asset))
    return ErrorCode::SUPPLY_OVERFLOW;

  Issue (to, asset, amount);
  return ErrorCode::OK;
}

void
Ledger::Issue (const std::string& to, const std::string& asset,
               const Amount amount)
{
  VLOG (1) << "Issuing " << amount << " " << asset << " to " << to;
  CHECK (AssetExists (asset)) << "Issuing unknown asset " << asset;
  CHECK_GE (amount, 0);
  if (amount == 0)
    return;

  supply.Increment (asset, amount);
  balances.Add (to, asset, amount);
}

ErrorCode
Ledger::AddMinter (const std::string& caller, const std::string& asset,
                   const std::string& minter)
{
  auto a = assets.GetByName (asset);
  if (a == nullptr)
    return ErrorCode::UNKNOWN_ASSET;

  GovernanceRecord gov(*a->MutableProto ().mutable_governance (),
                       events, asset);
  const ErrorCode err = gov.RequireGovernance (caller);
  if (err != ErrorCode::OK)
    return err;
  if (minter.empty ())
    return ErrorCode::INVALID_ADDRESS;

  assets.AddMinter (asset, minter);

  Json::Value args(Json::objectValue);
  args["minter"] = minter;
  events.Emit (asset, "MinterAdded", args);

  return ErrorCode::OK;
}

ErrorCode
Ledger::RemoveMinter (const std::string& caller, const std::string& asset,
                      const std::string& minter)
{
  auto a = assets.GetByName (asset);
  if (a == nullptr)
    return ErrorCode::UNKNOWN_ASSET;

  GovernanceRecord gov(*a->MutableProto ().mutable_governance (),
                       events, asset);
  const ErrorCode err = gov.RequireGovernance (caller);
  if (err != ErrorCode::OK)
    return err;

  assets.RemoveMinter (asset, minter);

  Json::Value args(Json::objectValue);
  args["minter"] = minter;
  events.Emit (asset, "MinterRemoved", args);

  return ErrorCode::OK;
}

bool
Ledger::IsMinter (const std::string& asset, const std::string& minter)
{
  return assets.IsMinter (asset, minter);
}

ErrorCode
Ledger::SetPendingGovernance (const std::string& caller,
                              const std::string& asset,
                              const std::string& pending)
{
  auto a = assets.GetByName (asset);
  if (a == nullptr)
    return ErrorCode::UNKNOWN_ASSET;

  GovernanceRecord gov(*a->MutableProto ().mutable_governance (),
                       events, asset);
  return gov.SetPending (caller, pending);
}

ErrorCode
Ledger::AcceptGovernance (const std::string& caller, const std::string& asset)
{
  auto a = assets.GetByName (asset);
  if (a == nullptr)
    return ErrorCode::UNKNOWN_ASSET;

  GovernanceRecord gov(*a->MutableProto ().mutable_governance (),
                       events, asset);
  return gov.Accept (caller);
}

} // namespace bonds
