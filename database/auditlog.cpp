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

#include "auditlog.hpp"

#include <glog/logging.h>

#include <map>

namespace vestsale
{

namespace
{

const std::map<AuditEntry::Type, std::string> TYPE_STRINGS = {
  {AuditEntry::Type::ALLOCATION, "allocation"},
  {AuditEntry::Type::CLAIM, "claim"},
  {AuditEntry::Type::CONTRIBUTION, "contribution"},
  {AuditEntry::Type::DIRECT, "direct"},
  {AuditEntry::Type::BONUS, "bonus"},
  {AuditEntry::Type::RELEASE, "release"},
  {AuditEntry::Type::FINALISE, "finalise"},
};

} // anonymous namespace

std::string
AuditTypeToString (const AuditEntry::Type t)
{
  const auto mit = TYPE_STRINGS.find (t);
  CHECK (mit != TYPE_STRINGS.end ())
      << "Invalid audit entry type: " << static_cast<int> (t);
  return mit->second;
}

AuditEntry::Type
AuditTypeFromString (const std::string& str)
{
  for (const auto& entry : TYPE_STRINGS)
    if (entry.second == str)
      return entry.first;

  return AuditEntry::Type::INVALID;
}

AuditEntry::AuditEntry (Database& d)
  : db(d), id(0), time(0), type(Type::INVALID), amount(0),
    hasAllocation(false), allocation(0), isNew(true)
{}

AuditEntry::AuditEntry (Database& d,
                        const Database::Result<AuditEntryResult>& res)
  : db(d), isNew(false)
{
  id = res.Get<AuditEntryResult::id> ();
  time = res.Get<AuditEntryResult::time> ();
  type = AuditTypeFromString (res.Get<AuditEntryResult::type> ());
  CHECK (type != Type::INVALID) << "Invalid audit entry type in the database";
  account = res.Get<AuditEntryResult::account> ();
  amount = res.Get<AuditEntryResult::amount> ();

  hasAllocation = !res.IsNull<AuditEntryResult::allocation> ();
  if (hasAllocation)
    allocation = res.Get<AuditEntryResult::allocation> ();
  else
    allocation = 0;
}

AuditEntry::~AuditEntry ()
{
  if (!isNew)
    return;

  VLOG (1)
      << "Recording " << AuditTypeToString (type) << " event for "
      << account << " with amount " << amount;

  CHECK_NE (account, "") << "No account set for audit entry";
  CHECK_GE (amount, 0) << "Negative amount for audit entry";

  auto stmt = db.Prepare (R"(
    INSERT INTO `audit_log`
      (`time`, `type`, `account`, `amount`, `allocation`)
      VALUES (?1, ?2, ?3, ?4, ?5)
  )");

  stmt.Bind (1, time);
  stmt.Bind (2, AuditTypeToString (type));
  stmt.Bind (3, account);
  stmt.Bind (4, amount);
  if (hasAllocation)
    stmt.Bind (5, allocation);
  else
    stmt.BindNull (5);

  stmt.Execute ();
}

AllocationIndex
AuditEntry::GetAllocation () const
{
  CHECK (hasAllocation) << "Audit entry has no allocation";
  return allocation;
}

void
AuditEntry::SetAllocation (const AllocationIndex idx)
{
  CHECK (isNew) << "Audit entries are immutable";
  hasAllocation = true;
  allocation = idx;
}

AuditLogTable::Handle
AuditLogTable::Record (const int64_t time, const AuditEntry::Type type,
                       const std::string& account, const Amount amount)
{
  CHECK (type != AuditEntry::Type::INVALID);

  Handle h(new AuditEntry (db));
  h->time = time;
  h->type = type;
  h->account = account;
  h->amount = amount;

  return h;
}

AuditLogTable::Handle
AuditLogTable::GetFromResult (
    const Database::Result<AuditEntryResult>& res) const
{
  return Handle (new AuditEntry (db, res));
}

Database::Result<AuditEntryResult>
AuditLogTable::QueryAll () const
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `audit_log`
      ORDER BY `id`
  )");
  return stmt.Query<AuditEntryResult> ();
}

Database::Result<AuditEntryResult>
AuditLogTable::QueryForAccount (const std::string& account) const
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `audit_log`
      WHERE `account` = ?1
      ORDER BY `id`
  )");
  stmt.Bind (1, account);
  return stmt.Query<AuditEntryResult> ();
}

} // namespace vestsale
