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

#ifndef VESTSALE_CHECKEDMATH_HPP
#define VESTSALE_CHECKEDMATH_HPP

#include "errors.hpp"

#include "database/amount.hpp"

namespace vestsale
{

/*
 * Arithmetic on amounts that throws SaleError with ErrorCode::ARITHMETIC
 * instead of overflowing.  Results must also stay within the valid range
 * [0, MAX_AMOUNT] of amounts.
 */

Amount CheckedAdd (Amount a, Amount b);
Amount CheckedSub (Amount a, Amount b);
Amount CheckedMul (Amount a, Amount b);

/**
 * Truncating division.  Throws on division by zero.
 */
Amount CheckedDiv (Amount a, Amount b);

} // namespace vestsale

#endif // VESTSALE_CHECKEDMATH_HPP
