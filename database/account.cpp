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

#include "account.hpp"

#include <glog/logging.h>

namespace vestsale
{

Account::Account (Database& d, const std::string& n)
  : db(d), name(n), balance(0), dirty(true)
{
  VLOG (1) << "Created instance for new account " << name;
}

Account::Account (Database& d, const Database::Result<AccountResult>& res)
  : db(d), dirty(false)
{
  name = res.Get<AccountResult::name> ();
  balance = res.Get<AccountResult::balance> ();

  VLOG (1) << "Created account instance for " << name << " from database";
}

Account::~Account ()
{
  if (!dirty)
    {
      VLOG (1) << "Account instance " << name << " is not dirty";
      return;
    }

  VLOG (1) << "Updating account " << name << " in the database";
  CHECK_GE (balance, 0);

  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `accounts`
      (`name`, `balance`)
      VALUES (?1, ?2)
  )");

  stmt.Bind (1, name);
  stmt.Bind (2, balance);

  stmt.Execute ();
}

void
Account::AddBalance (const Amount val)
{
  balance += val;
  CHECK_GE (balance, 0) << "Negative balance for " << name;
  CHECK_LE (balance, MAX_AMOUNT) << "Balance overflow for " << name;
  dirty = true;
}

AccountsTable::Handle
AccountsTable::CreateNew (const std::string& name)
{
  CHECK (GetByName (name) == nullptr)
      << "Account for " << name << " exists already";
  return Handle (new Account (db, name));
}

AccountsTable::Handle
AccountsTable::GetFromResult (const Database::Result<AccountResult>& res)
{
  return Handle (new Account (db, res));
}

AccountsTable::Handle
AccountsTable::GetByName (const std::string& name)
{
  auto stmt = db.Prepare ("SELECT * FROM `accounts` WHERE `name` = ?1");
  stmt.Bind (1, name);
  auto res = stmt.Query<AccountResult> ();

  if (!res.Step ())
    return nullptr;

  auto r = GetFromResult (res);
  CHECK (!res.Step ());
  return r;
}

AccountsTable::Handle
AccountsTable::GetOrCreate (const std::string& name)
{
  auto res = GetByName (name);
  if (res == nullptr)
    res.reset (new Account (db, name));
  return res;
}

Database::Result<AccountResult>
AccountsTable::QueryAll ()
{
  auto stmt = db.Prepare (R"(
    SELECT *
      FROM `accounts`
      ORDER BY `name`
  )");
  return stmt.Query<AccountResult> ();
}

namespace
{

struct SumResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, total, 1);
};

} // anonymous namespace

Amount
AccountsTable::GetTotalBalance ()
{
  auto stmt = db.Prepare (R"(
    SELECT COALESCE (SUM (`balance`), 0) AS `total`
      FROM `accounts`
  )");
  auto res = stmt.Query<SumResult> ();
  CHECK (res.Step ());
  const Amount total = res.Get<SumResult::total> ();
  CHECK (!res.Step ());
  return total;
}

} // namespace vestsale
