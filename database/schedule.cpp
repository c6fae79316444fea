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

#include "schedule.hpp"

#include <glog/logging.h>

namespace vestsale
{

VestingSchedule::VestingSchedule (
    Database& d, const Database::Result<VestingScheduleResult>& res)
  : db(d)
{
  administrator = res.Get<VestingScheduleResult::administrator> ();
  unlockDate = res.Get<VestingScheduleResult::unlock_date> ();
  intervalDuration = res.Get<VestingScheduleResult::interval_duration> ();
  numIntervals = res.Get<VestingScheduleResult::num_intervals> ();
  currentInterval = res.Get<VestingScheduleResult::current_interval> ();
}

VestingSchedule::~VestingSchedule ()
{
  if (!dirty)
    return;

  VLOG (1)
      << "Updating current vesting interval to " << currentInterval
      << " in the database";

  auto stmt = db.Prepare (R"(
    UPDATE `vesting_schedule`
      SET `current_interval` = ?1
      WHERE `id` = 1
  )");
  stmt.Bind (1, currentInterval);
  stmt.Execute ();
}

void
VestingSchedule::AdvanceInterval ()
{
  CHECK_LT (currentInterval, numIntervals)
      << "All vesting intervals have been processed already";
  ++currentInterval;
  dirty = true;
}

void
VestingScheduleTable::Initialise (const std::string& administrator,
                                  const proto::VestingParams& params)
{
  LOG (INFO)
      << "Initialising vesting schedule with " << params.num_intervals ()
      << " intervals of " << params.interval_duration () << " seconds"
      << " from " << params.unlock_date ();
  CHECK (!IsInitialised ()) << "Vesting schedule is already initialised";
  CHECK_GT (params.num_intervals (), 0);

  auto stmt = db.Prepare (R"(
    INSERT INTO `vesting_schedule`
      (`id`, `administrator`,
       `unlock_date`, `interval_duration`, `num_intervals`,
       `current_interval`)
      VALUES (1, ?1, ?2, ?3, ?4, 0)
  )");
  stmt.Bind (1, administrator);
  stmt.Bind<int64_t> (2, params.unlock_date ());
  stmt.Bind<int64_t> (3, params.interval_duration ());
  stmt.Bind<uint32_t> (4, params.num_intervals ());
  stmt.Execute ();
}

bool
VestingScheduleTable::IsInitialised ()
{
  auto stmt = db.Prepare ("SELECT * FROM `vesting_schedule`");
  auto res = stmt.Query<VestingScheduleResult> ();
  return res.Step ();
}

VestingScheduleTable::Handle
VestingScheduleTable::Get ()
{
  auto stmt = db.Prepare ("SELECT * FROM `vesting_schedule` WHERE `id` = 1");
  auto res = stmt.Query<VestingScheduleResult> ();
  CHECK (res.Step ()) << "Vesting schedule has not been initialised";

  Handle h(new VestingSchedule (db, res));
  CHECK (!res.Step ());

  return h;
}

} // namespace vestsale
