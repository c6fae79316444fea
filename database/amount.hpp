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

#ifndef DATABASE_AMOUNT_HPP
#define DATABASE_AMOUNT_HPP

#include <cstdint>

namespace vestsale
{

/**
 * An amount of reward units or of contributed funds.  Both are indivisible
 * integer quantities; conversions between them go through the sale rate.
 */
using Amount = int64_t;

/**
 * Highest valid value for an amount.  This is used to reject obviously
 * bogus values from operations and the configuration, well before any
 * of the arithmetic could overflow.
 */
constexpr Amount MAX_AMOUNT = 1'000'000'000'000'000'000;

} // namespace vestsale

#endif // DATABASE_AMOUNT_HPP
