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

#include "errors.hpp"

#include <glog/logging.h>

namespace bonds
{

std::string
ErrorToString (const ErrorCode err)
{
  switch (err)
    {
    case ErrorCode::OK:
      return "ok";

    case ErrorCode::ZERO_ADDRESS_GOVERNANCE:
      return "zero address governance";
    case ErrorCode::ZERO_ADDRESS_REWARD:
      return "zero address reward";
    case ErrorCode::ZERO_ADDRESS_LOCK_VAULT:
      return "zero address lock vault";
    case ErrorCode::ZERO_ADDRESS_POOL:
      return "zero address pool";
    case ErrorCode::ZERO_ADDRESS_DAO:
      return "zero address dao";
    case ErrorCode::ZERO_ADDRESS_PRINCIPAL:
      return "zero address principal";
    case ErrorCode::INVALID_PRICE:
      return "invalid price";
    case ErrorCode::ZERO_DENOMINATOR:
      return "1/0";
    case ErrorCode::INVALID_DATES:
      return "invalid dates";
    case ErrorCode::INVALID_HALF_LIFE:
      return "invalid halflife";
    case ErrorCode::INVALID_FEE:
      return "invalid bond fee";
    case ErrorCode::TELLER_EXISTS:
      return "teller exists";

    case ErrorCode::PAUSED:
      return "cannot deposit while paused";
    case ErrorCode::NOT_INITIALISED:
      return "not initialized";
    case ErrorCode::NOT_STARTED:
      return "bond not yet started";
    case ErrorCode::CONCLUDED:
      return "bond concluded";
    case ErrorCode::ZERO_PRICE:
      return "zero price";
    case ErrorCode::LOCKED:
      return "locked";

    case ErrorCode::AT_CAPACITY:
      return "bond at capacity";
    case ErrorCode::TOO_LARGE:
      return "bond too large";
    case ErrorCode::SLIPPAGE:
      return "slippage protection";
    case ErrorCode::ZERO_PAYOUT:
      return "zero payout";
    case ErrorCode::ZERO_AMOUNT:
      return "zero amount";
    case ErrorCode::LOCK_TOO_LONG:
      return "Max lock is 4 years";
    case ErrorCode::INSUFFICIENT_BALANCE:
      return "insufficient balance";
    case ErrorCode::INSUFFICIENT_ALLOWANCE:
      return "insufficient allowance";
    case ErrorCode::SUPPLY_OVERFLOW:
      return "supply overflow";

    case ErrorCode::NOT_GOVERNANCE:
      return "!governance";
    case ErrorCode::NOT_PENDING_GOVERNANCE:
      return "!pending governance";
    case ErrorCode::NOT_TELLER:
      return "!teller";
    case ErrorCode::NOT_MINTER:
      return "!minter";
    case ErrorCode::NOT_BONDER:
      return "!bonder";
    case ErrorCode::NOT_LOCK_OWNER:
      return "only owner";
    case ErrorCode::PERMIT_UNSUPPORTED:
      return "principal does not support permit";
    case ErrorCode::PERMIT_EXPIRED:
      return "permit expired";

    case ErrorCode::INVALID_ADDRESS:
      return "invalid address";
    case ErrorCode::NONEXISTENT_TOKEN:
      return "query for nonexistent token";
    case ErrorCode::UNKNOWN_ASSET:
      return "unknown asset";
    case ErrorCode::UNKNOWN_TELLER:
      return "unknown teller";
    case ErrorCode::UNKNOWN_DEPOSITORY:
      return "unknown depository";
    }

  LOG (FATAL) << "Invalid error code: " << static_cast<int> (err);
}

std::ostream&
operator<< (std::ostream& out, const ErrorCode err)
{
  return out << ErrorToString (err);
}

} // namespace bonds
