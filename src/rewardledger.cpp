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

#include "rewardledger.hpp"

#include "checkedmath.hpp"
#include "errors.hpp"

#include "database/account.hpp"
#include "database/savepoint.hpp"

#include <glog/logging.h>

namespace vestsale
{

namespace
{

struct LedgerStateResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, issuer, 1);
  RESULT_COLUMN (int64_t, frozen, 2);
};

/**
 * Reads the single row of ledger state.  CHECK-fails if the ledger has
 * not been initialised.
 */
void
ReadState (Database& db, std::string& issuer, bool& frozen)
{
  auto stmt = db.Prepare (R"(
    SELECT `issuer`, `frozen`
      FROM `reward_ledger`
      WHERE `id` = 1
  )");
  auto res = stmt.Query<LedgerStateResult> ();
  CHECK (res.Step ()) << "Reward ledger has not been initialised";

  issuer = res.Get<LedgerStateResult::issuer> ();
  frozen = (res.Get<LedgerStateResult::frozen> () != 0);
  CHECK (!res.Step ());
}

} // anonymous namespace

void
DbRewardLedger::Initialise (const std::string& issuer)
{
  auto lock = db.LockOperations ();

  LOG (INFO) << "Initialising reward ledger with issuer " << issuer;
  CHECK_NE (issuer, "");

  auto stmt = db.Prepare (R"(
    INSERT INTO `reward_ledger`
      (`id`, `issuer`, `frozen`) VALUES (1, ?1, 0)
  )");
  stmt.Bind (1, issuer);
  stmt.Execute ();
}

bool
DbRewardLedger::IsInitialised () const
{
  auto lock = db.LockOperations ();

  auto stmt = db.Prepare ("SELECT `issuer`, `frozen` FROM `reward_ledger`");
  auto res = stmt.Query<LedgerStateResult> ();
  return res.Step ();
}

std::string
DbRewardLedger::GetIssuer () const
{
  auto lock = db.LockOperations ();

  std::string issuer;
  bool frozen;
  ReadState (db, issuer, frozen);

  return issuer;
}

bool
DbRewardLedger::IsFrozen () const
{
  auto lock = db.LockOperations ();

  std::string issuer;
  bool frozen;
  ReadState (db, issuer, frozen);

  return frozen;
}

void
DbRewardLedger::CheckIssuer (const std::string& caller,
                             const bool forIssuance) const
{
  std::string issuer;
  bool frozen;
  ReadState (db, issuer, frozen);

  if (caller != issuer)
    throw SaleError (ErrorCode::UNAUTHORIZED,
                     caller + " is not the reward issuer");
  if (forIssuance && frozen)
    throw SaleError (ErrorCode::ISSUANCE_FROZEN,
                     "reward issuance has been frozen");
}

void
DbRewardLedger::Issue (const std::string& caller, const std::string& account,
                       const Amount amount)
{
  auto lock = db.LockOperations ();

  CheckIssuer (caller, true);
  if (amount < 0 || amount > MAX_AMOUNT || account.empty ())
    throw SaleError (ErrorCode::INVALID_ARGUMENT, "invalid issuance");
  if (amount == 0)
    return;

  AccountsTable accounts(db);
  auto a = accounts.GetOrCreate (account);
  /* Throws if the new balance would be out of range.  */
  CheckedAdd (a->GetBalance (), amount);

  VLOG (1) << "Issuing " << amount << " units to " << account;
  a->AddBalance (amount);
}

bool
DbRewardLedger::Transfer (const std::string& from, const std::string& to,
                          const Amount amount)
{
  auto lock = db.LockOperations ();

  if (amount < 0 || amount > MAX_AMOUNT || to.empty ())
    {
      LOG (WARNING) << "Invalid transfer of " << amount << " to " << to;
      return false;
    }
  if (amount == 0)
    return true;

  Savepoint sp(db, "transfer");
  {
    AccountsTable accounts(db);
    auto sender = accounts.GetByName (from);
    if (sender == nullptr || sender->GetBalance () < amount)
      {
        LOG (WARNING)
            << "Insufficient balance of " << from
            << " for transfer of " << amount;
        return false;
      }

    sender->AddBalance (-amount);
    if (from == to)
      sender->AddBalance (amount);
    else
      {
        sender.reset ();
        auto receiver = accounts.GetOrCreate (to);
        if (receiver->GetBalance () > MAX_AMOUNT - amount)
          {
            LOG (WARNING) << "Transfer would overflow balance of " << to;
            return false;
          }
        receiver->AddBalance (amount);
      }
  }
  sp.Commit ();

  VLOG (1)
      << "Transferred " << amount << " units from " << from << " to " << to;
  return true;
}

Amount
DbRewardLedger::BalanceOf (const std::string& account) const
{
  auto lock = db.LockOperations ();

  AccountsTable accounts(db);
  auto a = accounts.GetByName (account);
  if (a == nullptr)
    return 0;

  return a->GetBalance ();
}

void
DbRewardLedger::FreezeIssuance (const std::string& caller)
{
  auto lock = db.LockOperations ();

  CheckIssuer (caller, false);

  LOG (INFO) << "Freezing reward issuance";
  auto stmt = db.Prepare (R"(
    UPDATE `reward_ledger`
      SET `frozen` = 1
      WHERE `id` = 1
  )");
  stmt.Execute ();
}

void
DbRewardLedger::SetIssuer (const std::string& caller,
                           const std::string& issuer)
{
  auto lock = db.LockOperations ();

  CheckIssuer (caller, false);
  if (issuer.empty ())
    throw SaleError (ErrorCode::INVALID_ARGUMENT, "empty issuer");

  LOG (INFO) << "Changing reward issuer from " << caller << " to " << issuer;
  auto stmt = db.Prepare (R"(
    UPDATE `reward_ledger`
      SET `issuer` = ?1
      WHERE `id` = 1
  )");
  stmt.Bind (1, issuer);
  stmt.Execute ();
}

} // namespace vestsale
