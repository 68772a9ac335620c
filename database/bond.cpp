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

#include "bond.hpp"

#include <glog/logging.h>

namespace bonds
{

Bond::Bond (Database& d, const std::string& t, const Database::IdT i)
  : db(d), teller(t), id(i),
    principalPaid(0), payout(0), claimed(0),
    vestingStart(0), vestingTerm(0),
    isNew(true), dirty(false)
{
  VLOG (1) << "Created new bond " << id << " of teller " << teller;
}

Bond::Bond (Database& d, const Database::Result<BondResult>& res)
  : db(d), isNew(false), dirty(false)
{
  teller = res.Get<BondResult::teller> ();
  id = res.Get<BondResult::id> ();
  owner = res.Get<BondResult::owner> ();
  if (!res.IsNull<BondResult::approved> ())
    approved = res.Get<BondResult::approved> ();

  principalPaid = res.Get<BondResult::principal_paid> ();
  payout = res.Get<BondResult::payout> ();
  claimed = res.Get<BondResult::claimed> ();
  vestingStart = res.Get<BondResult::vesting_start> ();
  vestingTerm = res.Get<BondResult::vesting_term> ();
}

Bond::~Bond ()
{
  if (isNew && IsRedeemed ())
    {
      VLOG (1) << "Not inserting immediately redeemed bond " << id;
      return;
    }

  if (!isNew && !dirty)
    {
      VLOG (2) << "Bond " << id << " of " << teller << " is not dirty";
      return;
    }

  if (IsRedeemed ())
    {
      VLOG (1) << "Deleting redeemed bond " << id << " of " << teller;
      auto stmt = db.Prepare (R"(
        DELETE FROM `bonds`
          WHERE `teller` = ?1 AND `id` = ?2
      )");
      stmt.Bind (1, teller);
      stmt.Bind (2, id);
      stmt.Execute ();
      return;
    }

  VLOG (1) << "Updating bond " << id << " of " << teller << " in the database";

  CHECK_NE (owner, "") << "Bond " << id << " has no owner";
  CHECK_GT (payout, 0) << "Bond " << id << " has no payout";
  CHECK_GE (claimed, 0);
  CHECK_LT (claimed, payout);
  CHECK_GE (principalPaid, 0);
  CHECK_GE (vestingTerm, 0);

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `bonds`
      (`teller`, `id`, `owner`, `approved`,
       `principal_paid`, `payout`, `claimed`,
       `vesting_start`, `vesting_term`)
      VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)
  )");

  stmt.Bind (1, teller);
  stmt.Bind (2, id);
  stmt.Bind (3, owner);
  if (approved.empty ())
    stmt.BindNull (4);
  else
    stmt.Bind (4, approved);
  stmt.Bind (5, principalPaid);
  stmt.Bind (6, payout);
  stmt.Bind (7, claimed);
  stmt.Bind (8, vestingStart);
  stmt.Bind (9, vestingTerm);

  stmt.Execute ();
}

void
Bond::SetOwner (const std::string& o)
{
  CHECK_NE (o, "");
  owner = o;
  approved.clear ();
  dirty = true;
}

void
Bond::SetApproved (const std::string& a)
{
  approved = a;
  dirty = true;
}

void
Bond::AddClaimed (const Amount val)
{
  CHECK_GE (val, 0);
  CHECK_LE (val, payout - claimed)
      << "Claiming more than the payout of bond " << id;
  claimed += val;
  dirty = true;
}

BondsTable::Handle
BondsTable::CreateNew (const std::string& teller, const Database::IdT id,
                       const std::string& owner,
                       const Amount principalPaid, const Amount payout,
                       const int64_t vestingStart, const int64_t vestingTerm)
{
  CHECK (GetById (teller, id) == nullptr)
      << "Bond " << id << " of " << teller << " exists already";

  Handle b(new Bond (db, teller, id));

  b->owner = owner;
  b->principalPaid = principalPaid;
  b->payout = payout;
  b->vestingStart = vestingStart;
  b->vestingTerm = vestingTerm;

  return b;
}

BondsTable::Handle
BondsTable::GetFromResult (const Database::Result<BondResult>& res)
{
  return Handle (new Bond (db, res));
}

BondsTable::Handle
BondsTable::GetById (const std::string& teller, const Database::IdT id)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `bonds`
      WHERE `teller` = ?1 AND `id` = ?2
  )");
  stmt.Bind (1, teller);
  stmt.Bind (2, id);
  auto res = stmt.Query<BondResult> ();
  if (!res.Step ())
    return nullptr;

  auto b = GetFromResult (res);
  CHECK (!res.Step ());
  return b;
}

Database::Result<BondResult>
BondsTable::QueryAll ()
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `bonds`
      ORDER BY `teller`, `id`
  )");
  return stmt.Query<BondResult> ();
}

Database::Result<BondResult>
BondsTable::QueryForOwner (const std::string& owner)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `bonds`
      WHERE `owner` = ?1
      ORDER BY `teller`, `id`
  )");
  stmt.Bind (1, owner);
  return stmt.Query<BondResult> ();
}

Database::Result<BondResult>
BondsTable::QueryForTeller (const std::string& teller)
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `bonds`
      WHERE `teller` = ?1
      ORDER BY `id`
  )");
  stmt.Bind (1, teller);
  return stmt.Query<BondResult> ();
}

namespace
{

struct OperatorResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, operator_account, 1);
};

} // anonymous namespace

bool
BondsTable::IsOperator (const std::string& teller, const std::string& owner,
                        const std::string& op)
{
  auto stmt = db.Prepare (R"(
    SELECT `operator_account`
      FROM `bond_operators`
      WHERE `teller` = ?1 AND `owner` = ?2 AND `operator_account` = ?3
  )");
  stmt.Bind (1, teller);
  stmt.Bind (2, owner);
  stmt.Bind (3, op);

  auto res = stmt.Query<OperatorResult> ();
  return res.Step ();
}

void
BondsTable::SetOperator (const std::string& teller, const std::string& owner,
                         const std::string& op, const bool approved)
{
  VLOG (1)
      << "Setting operator " << op << " for " << owner << " on " << teller
      << " to " << approved;

  if (approved)
    {
      auto stmt = db.Prepare (R"(
        INSERT OR IGNORE INTO `bond_operators`
          (`teller`, `owner`, `operator_account`)
          VALUES (?1, ?2, ?3)
      )");
      stmt.Bind (1, teller);
      stmt.Bind (2, owner);
      stmt.Bind (3, op);
      stmt.Execute ();
      return;
    }

  auto stmt = db.Prepare (R"(
    DELETE FROM `bond_operators`
      WHERE `teller` = ?1 AND `owner` = ?2 AND `operator_account` = ?3
  )");
  stmt.Bind (1, teller);
  stmt.Bind (2, owner);
  stmt.Bind (3, op);
  stmt.Execute ();
}

} // namespace bonds
