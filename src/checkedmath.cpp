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

#include "checkedmath.hpp"

#include <sstream>

namespace vestsale
{

namespace
{

/**
 * Throws an arithmetic error for the given operation.
 */
void
ThrowArithmetic (const char* op, const Amount a, const Amount b)
{
  std::ostringstream msg;
  msg << "invalid " << op << " of " << a << " and " << b;
  throw SaleError (ErrorCode::ARITHMETIC, msg.str ());
}

/**
 * Verifies that both operands are valid amounts.
 */
void
CheckOperands (const char* op, const Amount a, const Amount b)
{
  if (a < 0 || a > MAX_AMOUNT || b < 0 || b > MAX_AMOUNT)
    ThrowArithmetic (op, a, b);
}

} // anonymous namespace

Amount
CheckedAdd (const Amount a, const Amount b)
{
  CheckOperands ("addition", a, b);

  /* Both values are at most MAX_AMOUNT, so this does not overflow int64.  */
  const Amount res = a + b;
  if (res > MAX_AMOUNT)
    ThrowArithmetic ("addition", a, b);

  return res;
}

Amount
CheckedSub (const Amount a, const Amount b)
{
  CheckOperands ("subtraction", a, b);
  if (b > a)
    ThrowArithmetic ("subtraction", a, b);

  return a - b;
}

Amount
CheckedMul (const Amount a, const Amount b)
{
  CheckOperands ("multiplication", a, b);
  if (a != 0 && b > MAX_AMOUNT / a)
    ThrowArithmetic ("multiplication", a, b);

  return a * b;
}

Amount
CheckedDiv (const Amount a, const Amount b)
{
  CheckOperands ("division", a, b);
  if (b == 0)
    ThrowArithmetic ("division", a, b);

  return a / b;
}

} // namespace vestsale
