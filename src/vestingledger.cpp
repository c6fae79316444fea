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

#include "vestingledger.hpp"

#include "checkedmath.hpp"
#include "errors.hpp"

#include "database/auditlog.hpp"
#include "database/savepoint.hpp"
#include "database/schedule.hpp"

#include <glog/logging.h>

#include <sstream>

namespace vestsale
{

namespace
{

/**
 * Throws unless the caller is the administrator of the schedule.
 */
void
CheckAdministrator (const VestingSchedule& schedule, const std::string& caller)
{
  if (caller != schedule.GetAdministrator ())
    throw SaleError (ErrorCode::UNAUTHORIZED,
                     caller + " is not the vesting administrator");
}

/**
 * Returns true if the schedule may move on to its next interval
 * at the given time.
 */
bool
CanAdvance (const VestingSchedule& schedule, const int64_t now)
{
  if (schedule.IsFinalInterval ())
    return false;

  const int64_t elapsed = now - schedule.GetUnlockDate ();
  if (elapsed <= 0)
    return false;

  /* This is elapsed > current * duration, without the overflow risk
     of the multiplication.  */
  const int64_t completed = (elapsed - 1) / schedule.GetIntervalDuration ();
  return completed >= schedule.GetCurrentInterval ();
}

} // anonymous namespace

void
VestingLedger::Initialise (const std::string& administrator,
                           const proto::VestingParams& params)
{
  auto lock = db.LockOperations ();

  if (params.num_intervals () == 0 || params.interval_duration () <= 0)
    throw SaleError (ErrorCode::INVALID_ARGUMENT, "invalid vesting schedule");

  VestingScheduleTable tbl(db);
  tbl.Initialise (administrator, params);
}

bool
VestingLedger::IsInitialised () const
{
  auto lock = db.LockOperations ();

  VestingScheduleTable tbl(db);
  return tbl.IsInitialised ();
}

AllocationIndex
VestingLedger::CreateAllocation (const std::string& caller,
                                 const std::string& beneficiary,
                                 const Amount amount)
{
  auto lock = db.LockOperations ();
  return CreateAllocation (caller, beneficiary, amount, clock.Now ());
}

AllocationIndex
VestingLedger::CreateAllocation (const std::string& caller,
                                 const std::string& beneficiary,
                                 const Amount amount, const int64_t now)
{
  Savepoint sp(db, "create_allocation");

  AllocationIndex idx;
  {
    VestingScheduleTable schedules(db);
    auto schedule = schedules.Get ();
    CheckAdministrator (*schedule, caller);

    if (now >= schedule->GetUnlockDate ())
      throw SaleError (ErrorCode::SCHEDULE_CLOSED,
                       "allocations are closed after the unlock date");
    if (amount < 0 || amount > MAX_AMOUNT || beneficiary.empty ())
      throw SaleError (ErrorCode::INVALID_ARGUMENT, "invalid allocation");

    AllocationsTable allocations(db);
    auto a = allocations.CreateNew (beneficiary, amount);
    idx = a->GetIndex ();

    AuditLogTable log(db);
    log.Record (now, AuditEntry::Type::ALLOCATION, beneficiary, amount)
        ->SetAllocation (idx);
  }
  sp.Commit ();

  LOG (INFO)
      << "Created vesting allocation " << idx << " of " << amount
      << " for " << beneficiary;
  return idx;
}

bool
VestingLedger::AdvanceInterval (const std::string& caller)
{
  auto lock = db.LockOperations ();
  return AdvanceInterval (caller, clock.Now ());
}

bool
VestingLedger::AdvanceInterval (const std::string& caller, const int64_t now)
{
  Savepoint sp(db, "advance_interval");

  bool advanced = false;
  unsigned interval;
  {
    VestingScheduleTable schedules(db);
    auto schedule = schedules.Get ();
    CheckAdministrator (*schedule, caller);

    interval = schedule->GetCurrentInterval ();
    if (CanAdvance (*schedule, now))
      {
        schedule->AdvanceInterval ();
        interval = schedule->GetCurrentInterval ();
        const bool isFinal = schedule->IsFinalInterval ();
        const Amount intervals = schedule->GetNumIntervals ();

        AllocationsTable allocations(db);
        auto res = allocations.QueryAll ();
        while (res.Step ())
          {
            auto a = allocations.GetFromResult (res);
            if (isFinal)
              a->SetCurrentReward (a->GetRemaining ());
            else
              a->SetCurrentReward (CheckedDiv (a->GetTotal (), intervals));
          }

        advanced = true;
      }
  }
  sp.Commit ();

  if (advanced)
    LOG (INFO) << "Advanced to vesting interval " << interval;
  else
    VLOG (1)
        << "Vesting interval " << interval
        << " cannot be advanced at time " << now;

  return advanced;
}

ClaimResult
VestingLedger::Claim (const std::string& caller, const AllocationIndex index)
{
  auto lock = db.LockOperations ();
  return Claim (caller, index, clock.Now ());
}

ClaimResult
VestingLedger::Claim (const std::string& caller, const AllocationIndex index,
                      const int64_t now)
{
  Savepoint sp(db, "claim");

  ClaimResult res;
  {
    VestingScheduleTable schedules(db);
    auto schedule = schedules.Get ();
    CheckAdministrator (*schedule, caller);

    AllocationsTable allocations(db);
    auto a = allocations.GetByIndex (index);
    if (a == nullptr)
      {
        std::ostringstream msg;
        msg << "allocation " << index << " does not exist";
        throw SaleError (ErrorCode::INDEX_OUT_OF_RANGE, msg.str ());
      }

    res.beneficiary = a->GetBeneficiary ();
    res.amount = a->GetCurrentReward ();

    const unsigned interval = schedule->GetCurrentInterval ();
    res.release = (a->GetLastClaimedInterval () < interval);
    if (res.release)
      {
        a->SetLastClaimedInterval (interval);
        a->SetRemaining (CheckedSub (a->GetRemaining (), res.amount));

        AuditLogTable log(db);
        log.Record (now, AuditEntry::Type::CLAIM, res.beneficiary,
                    res.amount)
            ->SetAllocation (index);
      }
  }
  sp.Commit ();

  if (res.release)
    VLOG (1)
        << "Claimed " << res.amount << " from allocation " << index
        << " for " << res.beneficiary;
  return res;
}

AllocationIndex
VestingLedger::Count () const
{
  auto lock = db.LockOperations ();

  AllocationsTable allocations(db);
  return allocations.Count ();
}

Amount
VestingLedger::AllocationAmount (const AllocationIndex index) const
{
  auto lock = db.LockOperations ();

  AllocationsTable allocations(db);
  auto a = allocations.GetByIndex (index);
  if (a == nullptr)
    {
      std::ostringstream msg;
      msg << "allocation " << index << " does not exist";
      throw SaleError (ErrorCode::INDEX_OUT_OF_RANGE, msg.str ());
    }

  return a->GetTotal ();
}

std::string
VestingLedger::GetAdministrator () const
{
  auto lock = db.LockOperations ();

  VestingScheduleTable schedules(db);
  return schedules.Get ()->GetAdministrator ();
}

unsigned
VestingLedger::GetCurrentInterval () const
{
  auto lock = db.LockOperations ();

  VestingScheduleTable schedules(db);
  return schedules.Get ()->GetCurrentInterval ();
}

unsigned
VestingLedger::GetNumIntervals () const
{
  auto lock = db.LockOperations ();

  VestingScheduleTable schedules(db);
  return schedules.Get ()->GetNumIntervals ();
}

int64_t
VestingLedger::GetUnlockDate () const
{
  auto lock = db.LockOperations ();

  VestingScheduleTable schedules(db);
  return schedules.Get ()->GetUnlockDate ();
}

int64_t
VestingLedger::GetIntervalDuration () const
{
  auto lock = db.LockOperations ();

  VestingScheduleTable schedules(db);
  return schedules.Get ()->GetIntervalDuration ();
}

} // namespace vestsale
