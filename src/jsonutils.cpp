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

#include "jsonutils.hpp"

#include <xayautil/jsonutils.hpp>

#include <glog/logging.h>

namespace vestsale
{

bool
AmountFromJson (const Json::Value& val, Amount& amount)
{
  if (!val.isInt64 () || !xaya::IsIntegerValue (val))
    return false;

  amount = val.asInt64 ();
  return amount >= 0 && amount <= MAX_AMOUNT;
}

bool
TimestampFromJson (const Json::Value& val, int64_t& ts)
{
  if (!val.isInt64 () || !xaya::IsIntegerValue (val))
    return false;

  ts = val.asInt64 ();
  return true;
}

bool
AccountFromJson (const Json::Value& val, std::string& name)
{
  if (!val.isString ())
    {
      VLOG (1) << "Account name is not a string: " << val;
      return false;
    }

  name = val.asString ();
  return !name.empty ();
}

template <>
  Json::Value
  IntToJson<int32_t> (const int32_t val)
{
  return static_cast<Json::Int> (val);
}

template <>
  Json::Value
  IntToJson<uint32_t> (const uint32_t val)
{
  return static_cast<Json::UInt> (val);
}

template <>
  Json::Value
  IntToJson<int64_t> (const int64_t val)
{
  return static_cast<Json::Int64> (val);
}

template <>
  Json::Value
  IntToJson<uint64_t> (const uint64_t val)
{
  return static_cast<Json::UInt64> (val);
}

} // namespace vestsale
