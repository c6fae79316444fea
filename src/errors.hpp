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

#ifndef VESTSALE_ERRORS_HPP
#define VESTSALE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace vestsale
{

/**
 * Error codes for failed sale operations.  All values have an explicit
 * integer number, because they are also returned in the JSON results of
 * processed operations.
 */
enum class ErrorCode
{

  /* The caller is not allowed to perform the operation.  */
  UNAUTHORIZED = 1,

  /* An allocation index does not exist.  */
  INDEX_OUT_OF_RANGE = 2,

  /* Allocations can no longer be created after the unlock date.  */
  SCHEDULE_CLOSED = 3,

  /* Finalise was called on a finalised sale.  */
  ALREADY_FINALIZED = 4,

  /* Issuing operations are not possible after finalisation.  */
  SALE_FINALIZED = 5,

  /* Wiring changes are not possible once the sale window opened.  */
  SALE_STARTED = 6,

  /* The sale can only be finalised once it has ended.  */
  NOT_ENDED = 7,

  /* A contribution was rejected by the admission check.  */
  NOT_ADMITTED = 8,

  /* Malformed or out-of-range argument.  */
  INVALID_ARGUMENT = 9,

  /* Overflow, underflow or division by zero.  */
  ARITHMETIC = 10,

  /* Transfer of vested reward units failed.  */
  TRANSFER_FAILED = 11,

  /* Reward units can no longer be issued.  */
  ISSUANCE_FROZEN = 12,

};

/**
 * Returns the string name of an error code, as used in logs and results.
 */
std::string ErrorCodeToString (ErrorCode code);

/**
 * Exception thrown when a sale operation fails.  Any database changes
 * made by the operation are rolled back when this propagates out of it.
 */
class SaleError : public std::runtime_error
{

private:

  /** The error code.  */
  ErrorCode code;

public:

  explicit SaleError (ErrorCode c, const std::string& msg);

  ErrorCode
  GetCode () const
  {
    return code;
  }

};

} // namespace vestsale

#endif // VESTSALE_ERRORS_HPP
