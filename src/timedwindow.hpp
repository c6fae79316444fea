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

#ifndef VESTSALE_TIMEDWINDOW_HPP
#define VESTSALE_TIMEDWINDOW_HPP

#include "proto/config.pb.h"

#include <cstdint>

namespace vestsale
{

/**
 * The time window during which a sale accepts contributions.  Both bounds
 * are inclusive, i.e. the window is open for start <= now <= end.
 */
class TimedWindow
{

private:

  /** The opening time.  */
  int64_t start;

  /** The closing time.  */
  int64_t end;

public:

  explicit TimedWindow (int64_t s, int64_t e);

  /**
   * Constructs the window from the sale parameters.
   */
  explicit TimedWindow (const proto::SaleParams& params);

  TimedWindow (const TimedWindow&) = default;
  TimedWindow& operator= (const TimedWindow&) = default;

  int64_t
  GetStart () const
  {
    return start;
  }

  int64_t
  GetEnd () const
  {
    return end;
  }

  bool
  HasStarted (const int64_t now) const
  {
    return now >= start;
  }

  bool
  HasEnded (const int64_t now) const
  {
    return now > end;
  }

  bool
  IsOpen (const int64_t now) const
  {
    return HasStarted (now) && !HasEnded (now);
  }

};

} // namespace vestsale

#endif // VESTSALE_TIMEDWINDOW_HPP
