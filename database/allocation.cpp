/*
    vestsale - accounting core for vested reward sales
    Copyright (C) 2021  Autonomous Worlds Ltd

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

#include "allocation.hpp"

#include <glog/logging.h>

namespace vestsale
{

Allocation::Allocation (Database& d, const AllocationIndex idx,
                        const std::string& b, const Amount amount)
  : db(d), index(idx), beneficiary(b),
    total(amount), remaining(amount),
    lastClaimed(0), currentReward(0),
    isNew(true), dirty(true)
{
  VLOG (1)
      << "Created new allocation " << index
      << " of " << amount << " for " << beneficiary;
  CHECK_GE (total, 0);
}

Allocation::Allocation (Database& d,
                        const Database::Result<AllocationResult>& res)
  : db(d), isNew(false), dirty(false)
{
  index = res.Get<AllocationResult::idx> ();
  beneficiary = res.Get<AllocationResult::beneficiary> ();
  total = res.Get<AllocationResult::total> ();
  remaining = res.Get<AllocationResult::remaining> ();
  lastClaimed = res.Get<AllocationResult::last_claimed> ();
  currentReward = res.Get<AllocationResult::current_reward> ();

  VLOG (2) << "Created allocation instance " << index << " from database";
}

Allocation::~Allocation ()
{
  if (!dirty)
    return;

  CHECK_GE (remaining, 0);
  CHECK_LE (remaining, total);

  if (isNew)
    {
      VLOG (1) << "Inserting new allocation " << index << " into the database";
      auto stmt = db.Prepare (R"(
        INSERT INTO `allocations`
          (`idx`, `beneficiary`, `total`, `remaining`,
           `last_claimed`, `current_reward`)
          VALUES (?1, ?2, ?3, ?4, ?5, ?6)
      )");

      stmt.Bind (1, index);
      stmt.Bind (2, beneficiary);
      stmt.Bind (3, total);
      stmt.Bind (4, remaining);
      stmt.Bind (5, lastClaimed);
      stmt.Bind (6, currentReward);
      stmt.Execute ();

      return;
    }

  VLOG (1) << "Updating allocation " << index << " in the database";
  auto stmt = db.Prepare (R"(
    UPDATE `allocations`
      SET `remaining` = ?2,
          `last_claimed` = ?3,
          `current_reward` = ?4
      WHERE `idx` = ?1
  )");

  stmt.Bind (1, index);
  stmt.Bind (2, remaining);
  stmt.Bind (3, lastClaimed);
  stmt.Bind (4, currentReward);
  stmt.Execute ();
}

void
Allocation::SetRemaining (const Amount val)
{
  CHECK_GE (val, 0);
  CHECK_LE (val, remaining)
      << "Remaining balance of allocation " << index << " increased";
  remaining = val;
  dirty = true;
}

void
Allocation::SetLastClaimedInterval (const unsigned interval)
{
  CHECK_GT (interval, lastClaimed);
  lastClaimed = interval;
  dirty = true;
}

void
Allocation::SetCurrentReward (const Amount val)
{
  CHECK_GE (val, 0);
  currentReward = val;
  dirty = true;
}

AllocationsTable::Handle
AllocationsTable::CreateNew (const std::string& beneficiary,
                             const Amount amount)
{
  return Handle (new Allocation (db, Count (), beneficiary, amount));
}

AllocationsTable::Handle
AllocationsTable::GetFromResult (
    const Database::Result<AllocationResult>& res)
{
  return Handle (new Allocation (db, res));
}

AllocationsTable::Handle
AllocationsTable::GetByIndex (const AllocationIndex idx)
{
  auto stmt = db.Prepare ("SELECT * FROM `allocations` WHERE `idx` = ?1");
  stmt.Bind (1, idx);
  auto res = stmt.Query<AllocationResult> ();

  if (!res.Step ())
    return nullptr;

  auto r = GetFromResult (res);
  CHECK (!res.Step ());
  return r;
}

Database::Result<AllocationResult>
AllocationsTable::QueryAll ()
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `allocations`
      ORDER BY `idx`
  )");
  return stmt.Query<AllocationResult> ();
}

namespace
{

struct CountResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, cnt, 1);
};

} // anonymous namespace

AllocationIndex
AllocationsTable::Count ()
{
  auto stmt = db.Prepare (R"(
    SELECT COUNT (*) AS `cnt`
      FROM `allocations`
  )");
  auto res = stmt.Query<CountResult> ();
  CHECK (res.Step ());
  const int64_t cnt = res.Get<CountResult::cnt> ();
  CHECK (!res.Step ());

  return cnt;
}

} // namespace vestsale
