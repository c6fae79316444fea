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

#include "errors.hpp"

#include <glog/logging.h>

namespace vestsale
{

std::string
ErrorCodeToString (const ErrorCode code)
{
  switch (code)
    {
    case ErrorCode::UNAUTHORIZED:
      return "unauthorized";
    case ErrorCode::INDEX_OUT_OF_RANGE:
      return "index out of range";
    case ErrorCode::SCHEDULE_CLOSED:
      return "schedule closed";
    case ErrorCode::ALREADY_FINALIZED:
      return "already finalized";
    case ErrorCode::SALE_FINALIZED:
      return "sale finalized";
    case ErrorCode::SALE_STARTED:
      return "sale started";
    case ErrorCode::NOT_ENDED:
      return "not ended";
    case ErrorCode::NOT_ADMITTED:
      return "not admitted";
    case ErrorCode::INVALID_ARGUMENT:
      return "invalid argument";
    case ErrorCode::ARITHMETIC:
      return "arithmetic";
    case ErrorCode::TRANSFER_FAILED:
      return "transfer failed";
    case ErrorCode::ISSUANCE_FROZEN:
      return "issuance frozen";
    }

  LOG (FATAL) << "Invalid error code: " << static_cast<int> (code);
}

SaleError::SaleError (const ErrorCode c, const std::string& msg)
  : std::runtime_error(ErrorCodeToString (c) + ": " + msg), code(c)
{}

} // namespace vestsale
