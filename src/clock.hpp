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

#ifndef VESTSALE_CLOCK_HPP
#define VESTSALE_CLOCK_HPP

#include <cstdint>

namespace vestsale
{

/**
 * Source of the current time (in seconds since the epoch) for the sale.
 */
class Clock
{

public:

  Clock () = default;
  virtual ~Clock () = default;

  Clock (const Clock&) = delete;
  void operator= (const Clock&) = delete;

  virtual int64_t Now () const = 0;

};

/**
 * Clock based on the system's wall time.
 */
class SystemClock : public Clock
{

public:

  SystemClock () = default;

  int64_t Now () const override;

};

/**
 * Clock that returns an explicitly set time.  This is used for tests
 * and for replaying operations with a given timestamp.
 */
class FixedClock : public Clock
{

private:

  /** The current time.  */
  int64_t now;

public:

  explicit FixedClock (const int64_t t = 0)
    : now(t)
  {}

  int64_t
  Now () const override
  {
    return now;
  }

  void
  Set (const int64_t t)
  {
    now = t;
  }

  void
  Advance (const int64_t d)
  {
    now += d;
  }

};

} // namespace vestsale

#endif // VESTSALE_CLOCK_HPP
