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

#include "clock.hpp"

#include <chrono>

namespace vestsale
{

int64_t
SystemClock::Now () const
{
  const auto sinceEpoch = std::chrono::system_clock::now ().time_since_epoch ();
  return std::chrono::duration_cast<std::chrono::seconds> (sinceEpoch).count ();
}

} // namespace vestsale
