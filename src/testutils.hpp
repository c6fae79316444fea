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

#ifndef VESTSALE_TESTUTILS_HPP
#define VESTSALE_TESTUTILS_HPP

#include "errors.hpp"

#include <gtest/gtest.h>

#include <json/json.h>

#include <string>

namespace vestsale
{

/**
 * Parses a string into JSON.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Checks for "partial equality" of the given JSON values.  Keys not present
 * in an expected object are not checked in the actual value.  Keys with a
 * null value in expected must not be present in actual, and the string
 * "null" matches an explicit JSON null.  Integers are compared by value
 * regardless of their signedness.
 */
bool PartialJsonEqual (const Json::Value& actual, const Json::Value& expected);

/**
 * Expects that the given statement throws a SaleError with the given code.
 */
#define EXPECT_SALE_ERROR(stmt, errCode) \
  try \
    { \
      stmt; \
      ADD_FAILURE () << "No SaleError thrown by: " #stmt; \
    } \
  catch (const ::vestsale::SaleError& exc) \
    { \
      EXPECT_EQ (::vestsale::ErrorCodeToString (exc.GetCode ()), \
                 ::vestsale::ErrorCodeToString (errCode)) \
          << exc.what (); \
    }

} // namespace vestsale

#endif // VESTSALE_TESTUTILS_HPP
