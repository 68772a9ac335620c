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

#include "moneysupply.hpp"

#include <glog/logging.h>

namespace bonds
{

namespace
{

struct MoneySupplyResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, asset, 1);
  RESULT_COLUMN (int64_t, amount, 2);
};

} // anonymous namespace

Amount
MoneySupply::Get (const std::string& asset)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `money_supply`
      WHERE `asset` = ?1
  )");
  stmt.Bind (1, asset);

  auto res = stmt.Query<MoneySupplyResult> ();
  CHECK (res.Step ()) << "Invalid asset: " << asset;

  const Amount amount = res.Get<MoneySupplyResult::amount> ();
  CHECK (!res.Step ());

  return amount;
}

void
MoneySupply::Increment (const std::string& asset, const Amount value)
{
  VLOG (1)
      << "Incrementing money supply for asset " << asset
      << " by " << value;
  CHECK_GT (value, 0);

  const Amount before = Get (asset);
  CHECK_LE (value, MAX_AMOUNT - before)
      << "Supply of " << asset << " would exceed the maximum";

  auto stmt = db.Prepare (R"(
    UPDATE `money_supply`
      SET `amount` = ?2
      WHERE `asset` = ?1
  )");
  stmt.Bind (1, asset);
  stmt.Bind (2, before + value);
  stmt.Execute ();
}

void
MoneySupply::InitialiseAsset (const std::string& asset)
{
  auto stmt = db.Prepare (R"(
    INSERT INTO `money_supply`
      (`asset`, `amount`) VALUES (?1, 0)
  )");
  stmt.Bind (1, asset);
  stmt.Execute ();
}

} // namespace bonds
