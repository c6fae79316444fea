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

#ifndef DATABASE_SCHEDULE_HPP
#define DATABASE_SCHEDULE_HPP

#include "database.hpp"

#include "proto/config.pb.h"

#include <cstdint>
#include <memory>
#include <string>

namespace vestsale
{

/**
 * Database result type for the vesting_schedule table.
 */
struct VestingScheduleResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, administrator, 1);
  RESULT_COLUMN (int64_t, unlock_date, 2);
  RESULT_COLUMN (int64_t, interval_duration, 3);
  RESULT_COLUMN (int64_t, num_intervals, 4);
  RESULT_COLUMN (int64_t, current_interval, 5);
};

/**
 * Handle for the (single) row of the vesting schedule in the database.
 * Only the interval counter is mutable.
 */
class VestingSchedule
{

private:

  /** Database reference this belongs to.  */
  Database& db;

  /** The administrator allowed to operate the ledger.  */
  std::string administrator;

  int64_t unlockDate;
  int64_t intervalDuration;
  unsigned numIntervals;

  /** The current interval counter.  */
  unsigned currentInterval;

  /** Whether the interval has been advanced.  */
  bool dirty = false;

  /**
   * Constructs the instance from the database row.
   */
  explicit VestingSchedule (Database& d,
                            const Database::Result<VestingScheduleResult>& res);

  friend class VestingScheduleTable;

public:

  /**
   * Writes the updated interval counter to the database if needed.
   */
  ~VestingSchedule ();

  VestingSchedule () = delete;
  VestingSchedule (const VestingSchedule&) = delete;
  void operator= (const VestingSchedule&) = delete;

  const std::string&
  GetAdministrator () const
  {
    return administrator;
  }

  int64_t
  GetUnlockDate () const
  {
    return unlockDate;
  }

  int64_t
  GetIntervalDuration () const
  {
    return intervalDuration;
  }

  unsigned
  GetNumIntervals () const
  {
    return numIntervals;
  }

  unsigned
  GetCurrentInterval () const
  {
    return currentInterval;
  }

  /**
   * Returns true if the current interval is the last one.
   */
  bool
  IsFinalInterval () const
  {
    return currentInterval == numIntervals;
  }

  /**
   * Moves on to the next interval.  Must not be called if all intervals
   * have been processed already.
   */
  void AdvanceInterval ();

};

/**
 * Access to the vesting schedule table.
 */
class VestingScheduleTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Movable handle to the schedule.  */
  using Handle = std::unique_ptr<VestingSchedule>;

  explicit VestingScheduleTable (Database& d)
    : db(d)
  {}

  VestingScheduleTable () = delete;
  VestingScheduleTable (const VestingScheduleTable&) = delete;
  void operator= (const VestingScheduleTable&) = delete;

  /**
   * Inserts the schedule with the given parameters, starting at interval
   * zero.  Must only be called once on a fresh database.
   */
  void Initialise (const std::string& administrator,
                   const proto::VestingParams& params);

  /**
   * Returns true if the schedule has been initialised.
   */
  bool IsInitialised ();

  /**
   * Returns the schedule.  CHECK-fails if it has not been initialised.
   */
  Handle Get ();

};

} // namespace vestsale

#endif // DATABASE_SCHEDULE_HPP
