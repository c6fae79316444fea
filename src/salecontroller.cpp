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

#include "salecontroller.hpp"

#include "checkedmath.hpp"
#include "errors.hpp"
#include "timedwindow.hpp"

#include "database/auditlog.hpp"
#include "database/issuance.hpp"
#include "database/salestate.hpp"
#include "database/savepoint.hpp"
#include "proto/saleconfig.hpp"

#include <glog/logging.h>

namespace vestsale
{

namespace
{

bool
HasEndedAt (const SaleState& state, const int64_t now)
{
  if (state.GetTotalRaised () >= state.GetParams ().capacity ())
    return true;

  const TimedWindow window(state.GetParams ());
  return window.HasEnded (now);
}

SaleStage
StageAt (const SaleState& state, const int64_t now)
{
  if (state.IsFinalised ())
    return SaleStage::FINALISED;

  const TimedWindow window(state.GetParams ());
  if (!window.HasStarted (now))
    return SaleStage::NOT_STARTED;

  if (state.GetTotalRaised () >= state.GetParams ().capacity ())
    return SaleStage::CAP_REACHED;
  if (window.HasEnded (now))
    return SaleStage::TIME_EXPIRED;

  return SaleStage::OPEN;
}

/**
 * Throws INVALID_ARGUMENT unless the value is a valid amount.
 */
void
CheckAmount (const Amount val)
{
  if (val < 0 || val > MAX_AMOUNT)
    throw SaleError (ErrorCode::INVALID_ARGUMENT, "invalid amount");
}

} // anonymous namespace

std::string
SaleStageToString (const SaleStage stage)
{
  switch (stage)
    {
    case SaleStage::NOT_STARTED:
      return "not started";
    case SaleStage::OPEN:
      return "open";
    case SaleStage::CAP_REACHED:
      return "cap reached";
    case SaleStage::TIME_EXPIRED:
      return "time expired";
    case SaleStage::FINALISED:
      return "finalised";
    }

  LOG (FATAL) << "Invalid sale stage: " << static_cast<int> (stage);
}

SaleController::SaleController (Database& d, const Clock& c,
                                VestingLedger& v, RewardLedger& r,
                                const AuthorisationOracle& o)
  : db(d), clock(c), vesting(&v), rewards(&r), oracle(&o)
{}

void
SaleController::Initialise (const std::string& administrator,
                            const proto::SaleParams& params)
{
  auto lock = db.LockOperations ();

  if (administrator.empty () || !ValidateSaleParams (params))
    throw SaleError (ErrorCode::INVALID_ARGUMENT, "invalid sale parameters");

  SaleStateTable tbl(db);
  tbl.Initialise (administrator, params);
}

bool
SaleController::IsInitialised () const
{
  auto lock = db.LockOperations ();

  SaleStateTable tbl(db);
  return tbl.IsInitialised ();
}

void
SaleController::SetFinalisationHook (FinalisationHook cb)
{
  auto lock = db.LockOperations ();
  onFinalised = std::move (cb);
}

void
SaleController::CheckAdministrator (const std::string& caller) const
{
  SaleStateTable tbl(db);
  if (caller != tbl.Get ()->GetAdministrator ())
    throw SaleError (ErrorCode::UNAUTHORIZED,
                     caller + " is not the sale administrator");
}

void
SaleController::CheckRebind (const std::string& caller,
                             const int64_t now) const
{
  CheckAdministrator (caller);

  SaleStateTable tbl(db);
  const TimedWindow window(tbl.Get ()->GetParams ());
  if (window.HasStarted (now))
    throw SaleError (ErrorCode::SALE_STARTED,
                     "collaborators cannot be changed after the start");
}

bool
SaleController::CheckAdmission (const std::string& contributor,
                                const Amount amount, const int64_t now) const
{
  SaleStateTable tbl(db);
  auto state = tbl.Get ();
  const auto& params = state->GetParams ();

  if (state->IsFinalised ())
    {
      LOG (WARNING) << "Contribution after finalisation";
      return false;
    }

  const TimedWindow window(params);
  if (!window.IsOpen (now))
    {
      LOG (WARNING) << "Contribution outside the sale window at " << now;
      return false;
    }

  if (amount > params.capacity () - state->GetTotalRaised ())
    {
      LOG (WARNING)
          << "Contribution of " << amount << " exceeds the remaining capacity";
      return false;
    }

  if (!oracle->IsAuthorised (contributor))
    {
      LOG (WARNING) << contributor << " is not authorised to contribute";
      return false;
    }

  if (amount < params.min_contribution ())
    {
      LOG (WARNING)
          << "Contribution of " << amount << " is below the minimum of "
          << params.min_contribution ();
      return false;
    }

  const Amount contributed
      = CheckedDiv (rewards->BalanceOf (contributor), params.rate ());
  if (amount > params.max_contribution () - contributed)
    {
      LOG (WARNING)
          << "Contribution of " << amount << " by " << contributor
          << " would exceed the maximum of " << params.max_contribution ();
      return false;
    }

  return true;
}

void
SaleController::IssueUnits (const std::string& controller,
                            const std::string& account, const Amount amount,
                            const IssuanceChannel channel)
{
  if (amount == 0)
    return;

  rewards->Issue (controller, account, amount);

  IssuanceTable issuance(db);
  issuance.Record (channel, amount);
}

bool
SaleController::IsAdmitted (const std::string& contributor,
                            const Amount amount) const
{
  auto lock = db.LockOperations ();

  if (amount < 0 || amount > MAX_AMOUNT)
    return false;

  return CheckAdmission (contributor, amount, clock.Now ());
}

void
SaleController::AcceptContribution (const std::string& contributor,
                                    const Amount amount)
{
  auto lock = db.LockOperations ();

  const int64_t now = clock.Now ();
  CheckAmount (amount);

  Savepoint sp(db, "contribution");
  {
    if (!CheckAdmission (contributor, amount, now))
      throw SaleError (ErrorCode::NOT_ADMITTED,
                       "contribution by " + contributor + " is not admitted");

    SaleStateTable tbl(db);
    auto state = tbl.Get ();
    const auto& params = state->GetParams ();

    const Amount units = CheckedMul (amount, params.rate ());
    const Amount share = CheckedMul (amount, params.administrator_rate ());
    IssueUnits (params.controller (), contributor, units,
                IssuanceChannel::CONTRIBUTION);
    IssueUnits (params.controller (), params.share_account (), share,
                IssuanceChannel::ADMINISTRATOR);

    state->SetTotalRaised (CheckedAdd (state->GetTotalRaised (), amount));

    AuditLogTable log(db);
    log.Record (now, AuditEntry::Type::CONTRIBUTION, contributor, amount);
  }
  sp.Commit ();

  LOG (INFO) << "Accepted contribution of " << amount << " by " << contributor;
}

void
SaleController::DirectIssue (const std::string& caller,
                             const std::string& beneficiary,
                             const Amount rewardAmount)
{
  auto lock = db.LockOperations ();

  const int64_t now = clock.Now ();
  Savepoint sp(db, "direct_issue");
  {
    CheckAdministrator (caller);

    SaleStateTable tbl(db);
    auto state = tbl.Get ();
    if (state->IsFinalised ())
      throw SaleError (ErrorCode::SALE_FINALIZED, "sale has been finalised");
    CheckAmount (rewardAmount);

    const auto& params = state->GetParams ();
    const Amount raised = CheckedDiv (rewardAmount, params.rate ());
    const Amount share
        = CheckedDiv (CheckedMul (params.administrator_rate (), rewardAmount),
                      params.rate ());

    IssueUnits (params.controller (), beneficiary, rewardAmount,
                IssuanceChannel::DIRECT);
    IssueUnits (params.controller (), params.share_account (), share,
                IssuanceChannel::ADMINISTRATOR);

    state->SetTotalRaised (CheckedAdd (state->GetTotalRaised (), raised));

    AuditLogTable log(db);
    log.Record (now, AuditEntry::Type::DIRECT, beneficiary, rewardAmount);
  }
  sp.Commit ();

  LOG (INFO)
      << "Issued " << rewardAmount << " units directly to " << beneficiary;
}

AllocationIndex
SaleController::CreateBonusAllocation (const std::string& caller,
                                       const std::string& beneficiary,
                                       const Amount rewardAmount)
{
  auto lock = db.LockOperations ();

  const int64_t now = clock.Now ();
  Savepoint sp(db, "bonus_allocation");

  AllocationIndex idx;
  {
    CheckAdministrator (caller);

    SaleStateTable tbl(db);
    auto state = tbl.Get ();
    if (state->IsFinalised ())
      throw SaleError (ErrorCode::SALE_FINALIZED, "sale has been finalised");
    CheckAmount (rewardAmount);

    const auto& params = state->GetParams ();
    const std::string& controller = params.controller ();

    const Amount share
        = CheckedDiv (CheckedMul (params.administrator_rate (), rewardAmount),
                      params.rate ());
    const Amount bonus
        = CheckedDiv (CheckedMul (params.bonus_percent (), rewardAmount), 100);
    const Amount immediate = CheckedSub (rewardAmount, bonus);

    IssueUnits (controller, params.share_account (), share,
                IssuanceChannel::ADMINISTRATOR);
    IssueUnits (controller, controller, bonus, IssuanceChannel::VESTING);
    idx = vesting->CreateAllocation (controller, beneficiary, bonus, now);
    IssueUnits (controller, beneficiary, immediate, IssuanceChannel::BONUS);

    AuditLogTable log(db);
    log.Record (now, AuditEntry::Type::BONUS, beneficiary, rewardAmount)
        ->SetAllocation (idx);
  }
  sp.Commit ();

  LOG (INFO)
      << "Created bonus of " << rewardAmount << " for " << beneficiary
      << " with vesting allocation " << idx;
  return idx;
}

bool
SaleController::ReleaseInternal (const std::string& controller,
                                 const int64_t now)
{
  if (!vesting->AdvanceInterval (controller, now))
    return false;

  Amount total = 0;
  const AllocationIndex num = vesting->Count ();
  for (AllocationIndex i = 0; i < num; ++i)
    {
      const auto claim = vesting->Claim (controller, i, now);
      if (!claim.release || claim.amount == 0)
        continue;

      if (!rewards->Transfer (controller, claim.beneficiary, claim.amount))
        throw SaleError (ErrorCode::TRANSFER_FAILED,
                         "failed to release vested units to "
                            + claim.beneficiary);

      total = CheckedAdd (total, claim.amount);
    }

  AuditLogTable log(db);
  log.Record (now, AuditEntry::Type::RELEASE, controller, total);

  LOG (INFO)
      << "Released " << total << " vested units in interval "
      << vesting->GetCurrentInterval ();
  return true;
}

bool
SaleController::ReleaseVestedRewards (const std::string& caller)
{
  auto lock = db.LockOperations ();

  const int64_t now = clock.Now ();
  Savepoint sp(db, "release");

  bool released;
  {
    CheckAdministrator (caller);

    SaleStateTable tbl(db);
    const std::string controller = tbl.Get ()->GetParams ().controller ();
    released = ReleaseInternal (controller, now);
  }
  sp.Commit ();

  return released;
}

void
SaleController::Finalise (const std::string& caller)
{
  FinalisationHook hook;

  {
    auto lock = db.LockOperations ();

    const int64_t now = clock.Now ();
    Savepoint sp(db, "finalise");
    {
      CheckAdministrator (caller);

      SaleStateTable tbl(db);
      auto state = tbl.Get ();
      if (state->IsFinalised ())
        throw SaleError (ErrorCode::ALREADY_FINALIZED,
                         "sale has already been finalised");
      if (!HasEndedAt (*state, now))
        throw SaleError (ErrorCode::NOT_ENDED, "sale has not yet ended");

      const std::string controller = state->GetParams ().controller ();
      rewards->FreezeIssuance (controller);
      if (!ReleaseInternal (controller, now))
        VLOG (1) << "No vested rewards due at finalisation";

      state->SetFinalised ();

      AuditLogTable log(db);
      log.Record (now, AuditEntry::Type::FINALISE, caller,
                  state->GetTotalRaised ());
    }
    sp.Commit ();

    LOG (INFO) << "The sale has been finalised";
    hook = onFinalised;
  }

  if (hook)
    hook ();
}

void
SaleController::SetAuthorisationOracle (const std::string& caller,
                                        const AuthorisationOracle& o)
{
  auto lock = db.LockOperations ();

  CheckRebind (caller, clock.Now ());
  oracle = &o;
}

void
SaleController::SetVestingLedger (const std::string& caller, VestingLedger& v)
{
  auto lock = db.LockOperations ();

  CheckRebind (caller, clock.Now ());
  vesting = &v;
}

void
SaleController::SetRewardLedger (const std::string& caller, RewardLedger& r)
{
  auto lock = db.LockOperations ();

  CheckRebind (caller, clock.Now ());
  rewards = &r;
}

void
SaleController::SetCapacity (const std::string& caller, const Amount capacity)
{
  Savepoint sp(db, "set_capacity");
  {
    CheckAdministrator (caller);

    SaleStateTable tbl(db);
    auto state = tbl.Get ();
    if (state->IsFinalised ())
      throw SaleError (ErrorCode::SALE_FINALIZED, "sale has been finalised");
    if (capacity <= 0 || capacity > MAX_AMOUNT)
      throw SaleError (ErrorCode::INVALID_ARGUMENT, "invalid capacity");

    state->MutableParams ().set_capacity (capacity);
  }
  sp.Commit ();

  LOG (INFO) << "Sale capacity changed to " << capacity;
}

void
SaleController::SetMaxContribution (const std::string& caller,
                                    const Amount maxContribution)
{
  Savepoint sp(db, "set_max_contribution");
  {
    CheckAdministrator (caller);

    SaleStateTable tbl(db);
    auto state = tbl.Get ();
    if (state->IsFinalised ())
      throw SaleError (ErrorCode::SALE_FINALIZED, "sale has been finalised");
    if (maxContribution <= 0 || maxContribution > MAX_AMOUNT
          || maxContribution < state->GetParams ().min_contribution ())
      throw SaleError (ErrorCode::INVALID_ARGUMENT,
                       "invalid maximum contribution");

    state->MutableParams ().set_max_contribution (maxContribution);
  }
  sp.Commit ();

  LOG (INFO) << "Maximum contribution changed to " << maxContribution;
}

void
SaleController::SetEndTime (const std::string& caller, const int64_t endTime)
{
  Savepoint sp(db, "set_end_time");
  {
    CheckAdministrator (caller);

    SaleStateTable tbl(db);
    auto state = tbl.Get ();
    if (state->IsFinalised ())
      throw SaleError (ErrorCode::SALE_FINALIZED, "sale has been finalised");
    if (endTime < state->GetParams ().start_time ())
      throw SaleError (ErrorCode::INVALID_ARGUMENT,
                       "sale cannot end before it starts");

    state->MutableParams ().set_end_time (endTime);
  }
  sp.Commit ();

  LOG (INFO) << "Sale end time changed to " << endTime;
}

void
SaleController::TransferAdministrator (const std::string& caller,
                                       const std::string& newAdmin)
{
  Savepoint sp(db, "transfer_administrator");
  {
    CheckAdministrator (caller);
    if (newAdmin.empty ())
      throw SaleError (ErrorCode::INVALID_ARGUMENT, "empty administrator");

    SaleStateTable tbl(db);
    tbl.Get ()->SetPendingAdministrator (newAdmin);
  }
  sp.Commit ();

  LOG (INFO) << caller << " offered the administrator role to " << newAdmin;
}

void
SaleController::AcceptAdministrator (const std::string& caller)
{
  Savepoint sp(db, "accept_administrator");
  {
    SaleStateTable tbl(db);
    auto state = tbl.Get ();
    const std::string& pending = state->GetPendingAdministrator ();
    if (pending.empty () || caller != pending)
      throw SaleError (ErrorCode::UNAUTHORIZED,
                       caller + " has not been offered the administrator role");

    state->SetAdministrator (caller);
  }
  sp.Commit ();

  LOG (INFO) << caller << " is now the sale administrator";
}

SaleStage
SaleController::GetStage () const
{
  auto lock = db.LockOperations ();

  SaleStateTable tbl(db);
  return StageAt (*tbl.Get (), clock.Now ());
}

bool
SaleController::HasEnded () const
{
  auto lock = db.LockOperations ();

  SaleStateTable tbl(db);
  return HasEndedAt (*tbl.Get (), clock.Now ());
}

Amount
SaleController::GetTotalRaised () const
{
  auto lock = db.LockOperations ();

  SaleStateTable tbl(db);
  return tbl.Get ()->GetTotalRaised ();
}

bool
SaleController::IsFinalised () const
{
  auto lock = db.LockOperations ();

  SaleStateTable tbl(db);
  return tbl.Get ()->IsFinalised ();
}

std::string
SaleController::GetAdministrator () const
{
  auto lock = db.LockOperations ();

  SaleStateTable tbl(db);
  return tbl.Get ()->GetAdministrator ();
}

std::string
SaleController::GetPendingAdministrator () const
{
  auto lock = db.LockOperations ();

  SaleStateTable tbl(db);
  return tbl.Get ()->GetPendingAdministrator ();
}

proto::SaleParams
SaleController::GetParams () const
{
  auto lock = db.LockOperations ();

  SaleStateTable tbl(db);
  return tbl.Get ()->GetParams ();
}

} // namespace vestsale
