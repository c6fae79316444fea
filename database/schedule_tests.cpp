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

#include "dbtest.hpp"

#include <gtest/gtest.h>

namespace vestsale
{
namespace
{

class VestingScheduleTests : public DBTestWithSchema
{

protected:

  VestingScheduleTable tbl;

  VestingScheduleTests ()
    : tbl(db)
  {}

  void
  Initialise (const unsigned intervals)
  {
    proto::VestingParams params;
    params.set_unlock_date (1'000);
    params.set_interval_duration (100);
    params.set_num_intervals (intervals);
    tbl.Initialise ("sale", params);
  }

};

TEST_F (VestingScheduleTests, Initialisation)
{
  EXPECT_FALSE (tbl.IsInitialised ());
  Initialise (3);
  EXPECT_TRUE (tbl.IsInitialised ());

  auto s = tbl.Get ();
  EXPECT_EQ (s->GetAdministrator (), "sale");
  EXPECT_EQ (s->GetUnlockDate (), 1'000);
  EXPECT_EQ (s->GetIntervalDuration (), 100);
  EXPECT_EQ (s->GetNumIntervals (), 3);
  EXPECT_EQ (s->GetCurrentInterval (), 0);
  EXPECT_FALSE (s->IsFinalInterval ());
}

TEST_F (VestingScheduleTests, InvalidInitialisation)
{
  EXPECT_DEATH (tbl.Get (), "has not been initialised");
  EXPECT_DEATH (Initialise (0), "num_intervals");

  Initialise (3);
  EXPECT_DEATH (Initialise (3), "already initialised");
}

TEST_F (VestingScheduleTests, AdvanceInterval)
{
  Initialise (2);

  tbl.Get ()->AdvanceInterval ();
  EXPECT_EQ (tbl.Get ()->GetCurrentInterval (), 1);
  EXPECT_FALSE (tbl.Get ()->IsFinalInterval ());

  tbl.Get ()->AdvanceInterval ();
  EXPECT_EQ (tbl.Get ()->GetCurrentInterval (), 2);
  EXPECT_TRUE (tbl.Get ()->IsFinalInterval ());

  EXPECT_DEATH (tbl.Get ()->AdvanceInterval (), "processed already");
}

} // anonymous namespace
} // namespace vestsale
