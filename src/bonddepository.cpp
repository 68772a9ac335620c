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

#include "bonddepository.hpp"

#include "governance.hpp"

#include <xayautil/hash.hpp>

#include <glog/logging.h>

namespace bonds
{

namespace
{

/** Length of the hash part in teller addresses (in hex characters).  */
constexpr size_t TELLER_HASH_LENGTH = 40;

/**
 * Checks that none of the copied addresses is empty.
 */
ErrorCode
CheckAddresses (const std::string& reward, const std::string& lockVault,
                const std::string& pool, const std::string& dao)
{
  if (reward.empty ())
    return ErrorCode::ZERO_ADDRESS_REWARD;
  if (lockVault.empty ())
    return ErrorCode::ZERO_ADDRESS_LOCK_VAULT;
  if (pool.empty ())
    return ErrorCode::ZERO_ADDRESS_POOL;
  if (dao.empty ())
    return ErrorCode::ZERO_ADDRESS_DAO;
  return ErrorCode::OK;
}

/**
 * Hashes the depository address together with a tag for the kind of
 * derivation and its value into a teller address.
 */
std::string
HashTellerAddress (const std::string& depository, const std::string& tag,
                   const std::string& value)
{
  const std::string sep(1, '\0');

  xaya::SHA256 hasher;
  hasher << depository << sep << tag << sep << value;
  const std::string hex = hasher.Finalise ().ToHex ();

  return BondDepository::TELLER_PREFIX + hex.substr (0, TELLER_HASH_LENGTH);
}

} // anonymous namespace

constexpr const char* BondDepository::TELLER_PREFIX;

BondDepository::BondDepository (Database& db, const Context& c, Ledger& l,
                                const std::string& addr)
  : address(addr), ctx(c), ledger(l),
    events(db, ctx.Height ()), depositories(db), tellers(db)
{}

void
BondDepository::Initialise (Database& db, const proto::DepositoryConfig& cfg)
{
  LOG (INFO) << "Creating depository " << cfg.address ();
  CHECK_NE (cfg.address (), "");
  CHECK_EQ (CheckAddresses (cfg.reward (), cfg.lock_vault (),
                            cfg.pool (), cfg.dao ()),
            ErrorCode::OK)
      << "Invalid configuration for depository " << cfg.address ();

  auto d = DepositoriesTable (db).CreateNew (cfg.address ());
  auto& pb = d->MutableProto ();
  GovernanceRecord::Initialise (*pb.mutable_governance (), cfg.governance ());
  pb.set_reward (cfg.reward ());
  pb.set_lock_vault (cfg.lock_vault ());
  pb.set_pool (cfg.pool ());
  pb.set_dao (cfg.dao ());
  pb.set_nonce (0);
}

std::string
BondDepository::TellerAddress (const std::string& depository,
                               const std::string& salt)
{
  return HashTellerAddress (depository, "salt", salt);
}

std::string
BondDepository::NonceTellerAddress (const std::string& depository,
                                    const uint64_t nonce)
{
  return HashTellerAddress (depository, "nonce", std::to_string (nonce));
}

std::string
BondDepository::PredictTellerAddress (const std::string& salt)
{
  if (!salt.empty ())
    return TellerAddress (address, salt);

  auto d = depositories.GetByAddress (address);
  if (d == nullptr)
    return "";

  return NonceTellerAddress (address, d->GetProto ().nonce ());
}

ErrorCode
BondDepository::AddTeller (const std::string& caller,
                           const std::string& teller)
{
  auto d = depositories.GetByAddress (address);
  if (d == nullptr)
    return ErrorCode::UNKNOWN_DEPOSITORY;

  GovernanceRecord gov(*d->MutableProto ().mutable_governance (),
                       events, address);
  const ErrorCode err = gov.RequireGovernance (caller);
  if (err != ErrorCode::OK)
    return err;
  if (teller.empty ())
    return ErrorCode::INVALID_ADDRESS;

  if (!d->AddTeller (teller))
    VLOG (1) << teller << " is already a teller of " << address;

  Json::Value args(Json::objectValue);
  args["teller"] = teller;
  events.Emit (address, "TellerAdded", args);

  return ErrorCode::OK;
}

ErrorCode
BondDepository::RemoveTeller (const std::string& caller,
                              const std::string& teller)
{
  auto d = depositories.GetByAddress (address);
  if (d == nullptr)
    return ErrorCode::UNKNOWN_DEPOSITORY;

  GovernanceRecord gov(*d->MutableProto ().mutable_governance (),
                       events, address);
  const ErrorCode err = gov.RequireGovernance (caller);
  if (err != ErrorCode::OK)
    return err;

  if (!d->RemoveTeller (teller))
    VLOG (1) << teller << " is not a teller of " << address;

  Json::Value args(Json::objectValue);
  args["teller"] = teller;
  events.Emit (address, "TellerRemoved", args);

  return ErrorCode::OK;
}

bool
BondDepository::IsTeller (const std::string& teller)
{
  auto d = depositories.GetByAddress (address);
  return d != nullptr && d->HasTeller (teller);
}

ErrorCode
BondDepository::SetAddresses (const std::string& caller,
                              const std::string& reward,
                              const std::string& lockVault,
                              const std::string& pool,
                              const std::string& dao)
{
  auto d = depositories.GetByAddress (address);
  if (d == nullptr)
    return ErrorCode::UNKNOWN_DEPOSITORY;

  GovernanceRecord gov(*d->MutableProto ().mutable_governance (),
                       events, address);
  ErrorCode err = gov.RequireGovernance (caller);
  if (err != ErrorCode::OK)
    return err;

  err = CheckAddresses (reward, lockVault, pool, dao);
  if (err != ErrorCode::OK)
    return err;
  if (!ledger.AssetExists (reward))
    return ErrorCode::UNKNOWN_ASSET;

  auto& pb = d->MutableProto ();
  pb.set_reward (reward);
  pb.set_lock_vault (lockVault);
  pb.set_pool (pool);
  pb.set_dao (dao);

  Json::Value args(Json::objectValue);
  args["reward"] = reward;
  args["lockvault"] = lockVault;
  args["pool"] = pool;
  args["dao"] = dao;
  events.Emit (address, "AddressesSet", args);

  return ErrorCode::OK;
}

ErrorCode
BondDepository::SetPendingGovernance (const std::string& caller,
                                      const std::string& pending)
{
  auto d = depositories.GetByAddress (address);
  if (d == nullptr)
    return ErrorCode::UNKNOWN_DEPOSITORY;

  GovernanceRecord gov(*d->MutableProto ().mutable_governance (),
                       events, address);
  return gov.SetPending (caller, pending);
}

ErrorCode
BondDepository::AcceptGovernance (const std::string& caller)
{
  auto d = depositories.GetByAddress (address);
  if (d == nullptr)
    return ErrorCode::UNKNOWN_DEPOSITORY;

  GovernanceRecord gov(*d->MutableProto ().mutable_governance (),
                       events, address);
  return gov.Accept (caller);
}

ErrorCode
BondDepository::PullReward (const std::string& teller, const Amount amount)
{
  auto d = depositories.GetByAddress (address);
  if (d == nullptr)
    return ErrorCode::UNKNOWN_DEPOSITORY;
  if (!d->HasTeller (teller))
    return ErrorCode::NOT_TELLER;

  const std::string& reward = d->GetProto ().reward ();
  if (!ledger.IsMinter (reward, address))
    return ErrorCode::NOT_MINTER;

  VLOG (1) << "Depository " << address << " minting " << amount
           << " " << reward << " for " << teller;
  return ledger.Mint (address, teller, reward, amount);
}

ErrorCode
BondDepository::CreateTeller (const std::string& caller,
                              const proto::TellerConfig& init,
                              const std::string& governance,
                              const std::string& salt,
                              std::string& tellerAddress)
{
  auto d = depositories.GetByAddress (address);
  if (d == nullptr)
    return ErrorCode::UNKNOWN_DEPOSITORY;

  GovernanceRecord depoGov(*d->MutableProto ().mutable_governance (),
                           events, address);
  const ErrorCode err = depoGov.RequireGovernance (caller);
  if (err != ErrorCode::OK)
    return err;

  if (governance.empty ())
    return ErrorCode::ZERO_ADDRESS_GOVERNANCE;
  if (init.principal ().empty ())
    return ErrorCode::ZERO_ADDRESS_PRINCIPAL;
  if (!ledger.AssetExists (init.principal ()))
    return ErrorCode::UNKNOWN_ASSET;

  const bool native = (init.kind () == proto::TellerConfig::NATIVE);
  if (native)
    {
      if (init.receiver ().empty ())
        return ErrorCode::INVALID_ADDRESS;
      if (tellers.GetByReceiver (init.receiver ()) != nullptr)
        return ErrorCode::TELLER_EXISTS;
    }

  if (salt.empty ())
    tellerAddress = NonceTellerAddress (address, d->GetProto ().nonce ());
  else
    tellerAddress = TellerAddress (address, salt);
  if (tellers.GetByAddress (tellerAddress) != nullptr)
    return ErrorCode::TELLER_EXISTS;

  if (salt.empty ())
    d->MutableProto ().set_nonce (d->GetProto ().nonce () + 1);

  LOG (INFO)
      << "Depository " << address << " creating teller " << tellerAddress
      << " for " << init.principal ();

  auto t = tellers.CreateNew (tellerAddress, address);
  auto& pb = t->MutableProto ();
  auto& cfg = *pb.mutable_config ();
  cfg.set_name (init.name ());
  cfg.set_principal (init.principal ());
  cfg.set_permittable (init.permittable ());
  cfg.set_kind (native ? proto::TellerConfig::NATIVE
                       : proto::TellerConfig::ERC20);
  if (native)
    cfg.set_receiver (init.receiver ());

  const auto& depo = d->GetProto ();
  cfg.set_reward (depo.reward ());
  cfg.set_lock_vault (depo.lock_vault ());
  cfg.set_pool (depo.pool ());
  cfg.set_dao (depo.dao ());
  cfg.set_depository (address);

  GovernanceRecord::Initialise (*pb.mutable_governance (), governance);
  pb.set_protocol_fee_bps (0);
  pb.set_paused (false);
  pb.set_num_bonds (0);

  Json::Value args(Json::objectValue);
  args["deployment"] = tellerAddress;
  args["name"] = init.name ();
  args["principal"] = init.principal ();
  events.Emit (address, "TellerCreated", args);

  return ErrorCode::OK;
}

} // namespace bonds
