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

#include "lockvault.hpp"

#include <glog/logging.h>

namespace bonds
{

LockVault::LockVault (Database& db, const Context& c, Ledger& l,
                      const std::string& addr)
  : address(addr), ctx(c), ledger(l),
    events(db, ctx.Height ()), locks(db)
{}

bool
LockVault::IsValidAddress (const std::string& addr)
{
  return addr.size () > 1 && addr[0] == '@';
}

ErrorCode
LockVault::CreateLock (const std::string& funder, const std::string& owner,
                       const std::string& asset, const Amount amount,
                       const int64_t end, Database::IdT& lockId)
{
  CHECK_GE (amount, 0);

  if (!IsValidAddress (address) || owner.empty ())
    return ErrorCode::INVALID_ADDRESS;
  if (!ledger.AssetExists (asset))
    return ErrorCode::UNKNOWN_ASSET;
  if (amount == 0)
    return ErrorCode::ZERO_AMOUNT;

  const int64_t maxDuration
      = ctx.RoConfig ()->params ().max_lock_duration ();
  if (end > ctx.Timestamp () + maxDuration)
    return ErrorCode::LOCK_TOO_LONG;

  const ErrorCode err = ledger.Transfer (funder, address, asset, amount);
  if (err != ErrorCode::OK)
    return err;

  auto l = locks.CreateNew (address, owner, asset, amount, end);
  lockId = l->GetId ();

  LOG (INFO)
      << "Created lock " << lockId << " in " << address
      << " for " << owner << ": " << amount << " " << asset
      << " until " << end;

  Json::Value args(Json::objectValue);
  args["lockid"] = static_cast<Json::Int64> (lockId);
  args["owner"] = owner;
  args["amount"] = static_cast<Json::Int64> (amount);
  args["end"] = static_cast<Json::Int64> (end);
  events.Emit (address, "CreateLock", args);

  return ErrorCode::OK;
}

ErrorCode
LockVault::Withdraw (const std::string& caller, const Database::IdT lockId,
                     const std::string& recipient)
{
  auto l = locks.GetById (lockId);
  if (l == nullptr || l->GetVault () != address)
    return ErrorCode::NONEXISTENT_TOKEN;
  if (l->GetOwner () != caller)
    return ErrorCode::NOT_LOCK_OWNER;
  if (ctx.Timestamp () < l->GetEnd ())
    return ErrorCode::LOCKED;
  if (recipient.empty ())
    return ErrorCode::INVALID_ADDRESS;

  const ErrorCode err = ledger.Transfer (address, recipient, l->GetAsset (),
                                         l->GetAmount ());
  CHECK (err == ErrorCode::OK)
      << "Vault " << address << " cannot pay out lock " << lockId
      << ": " << err;

  Json::Value args(Json::objectValue);
  args["lockid"] = static_cast<Json::Int64> (lockId);
  args["recipient"] = recipient;
  args["amount"] = static_cast<Json::Int64> (l->GetAmount ());
  events.Emit (address, "Withdraw", args);

  l->Delete ();
  return ErrorCode::OK;
}

} // namespace bonds
