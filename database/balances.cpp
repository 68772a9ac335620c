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

#include "balances.hpp"

#include <glog/logging.h>

namespace bonds
{

Amount
Balances::Get (const std::string& account, const std::string& asset)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `balances`
      WHERE `account` = ?1 AND `asset` = ?2
  )");
  stmt.Bind (1, account);
  stmt.Bind (2, asset);

  auto res = stmt.Query<BalanceResult> ();
  if (!res.Step ())
    return 0;

  const Amount amount = res.Get<BalanceResult::amount> ();
  CHECK (!res.Step ());

  return amount;
}

void
Balances::Add (const std::string& account, const std::string& asset,
               const Amount val)
{
  VLOG (1)
      << "Changing balance of " << account << " in " << asset
      << " by " << val;

  const Amount before = Get (account, asset);
  const Amount after = before + val;
  CHECK_GE (after, 0) << "Negative balance for " << account << " in " << asset;
  CHECK_LE (after, MAX_AMOUNT);

  if (after == 0)
    {
      auto stmt = db.Prepare (R"(
        DELETE FROM `balances`
          WHERE `account` = ?1 AND `asset` = ?2
      )");
      stmt.Bind (1, account);
      stmt.Bind (2, asset);
      stmt.Execute ();
      return;
    }

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `balances`
      (`account`, `asset`, `amount`)
      VALUES (?1, ?2, ?3)
  )");
  stmt.Bind (1, account);
  stmt.Bind (2, asset);
  stmt.Bind (3, after);
  stmt.Execute ();
}

Amount
Balances::GetAllowance (const std::string& owner, const std::string& spender,
                        const std::string& asset)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `allowances`
      WHERE `owner` = ?1 AND `spender` = ?2 AND `asset` = ?3
  )");
  stmt.Bind (1, owner);
  stmt.Bind (2, spender);
  stmt.Bind (3, asset);

  auto res = stmt.Query<AllowanceResult> ();
  if (!res.Step ())
    return 0;

  const Amount amount = res.Get<AllowanceResult::amount> ();
  CHECK (!res.Step ());

  return amount;
}

void
Balances::SetAllowance (const std::string& owner, const std::string& spender,
                        const std::string& asset, const Amount val)
{
  VLOG (1)
      << "Setting allowance of " << owner << " to " << spender
      << " in " << asset << " to " << val;
  CHECK_GE (val, 0);
  CHECK_LE (val, MAX_AMOUNT);

  if (val == 0)
    {
      auto stmt = db.Prepare (R"(
        DELETE FROM `allowances`
          WHERE `owner` = ?1 AND `spender` = ?2 AND `asset` = ?3
      )");
      stmt.Bind (1, owner);
      stmt.Bind (2, spender);
      stmt.Bind (3, asset);
      stmt.Execute ();
      return;
    }

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `allowances`
      (`owner`, `spender`, `asset`, `amount`)
      VALUES (?1, ?2, ?3, ?4)
  )");
  stmt.Bind (1, owner);
  stmt.Bind (2, spender);
  stmt.Bind (3, asset);
  stmt.Bind (4, val);
  stmt.Execute ();
}

Database::Result<BalanceResult>
Balances::QueryAll ()
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `balances`
      ORDER BY `account`, `asset`
  )");
  return stmt.Query<BalanceResult> ();
}

Database::Result<BalanceResult>
Balances::QueryForAccount (const std::string& account)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `balances`
      WHERE `account` = ?1
      ORDER BY `asset`
  )");
  stmt.Bind (1, account);
  return stmt.Query<BalanceResult> ();
}

Database::Result<AllowanceResult>
Balances::QueryAllowances ()
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `allowances`
      ORDER BY `owner`, `spender`, `asset`
  )");
  return stmt.Query<AllowanceResult> ();
}

} // namespace bonds
