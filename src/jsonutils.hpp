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

#ifndef VESTSALE_JSONUTILS_HPP
#define VESTSALE_JSONUTILS_HPP

#include "database/amount.hpp"

#include <json/json.h>

#include <string>

namespace vestsale
{

/**
 * Parses an amount (of contribution or reward units) from JSON, and
 * verifies that it is in the range [0, MAX_AMOUNT].
 */
bool AmountFromJson (const Json::Value& val, Amount& amount);

/**
 * Parses a timestamp (seconds) from JSON.  Any int64 value is accepted.
 */
bool TimestampFromJson (const Json::Value& val, int64_t& ts);

/**
 * Parses an account name from JSON.  It must be a non-empty string.
 */
bool AccountFromJson (const Json::Value& val, std::string& name);

/**
 * Converts an integer value to the proper JSON representation.
 */
template <typename T>
  Json::Value IntToJson (T val);

} // namespace vestsale

#endif // VESTSALE_JSONUTILS_HPP
