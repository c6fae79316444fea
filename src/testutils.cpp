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

#include "testutils.hpp"

#include <glog/logging.h>

#include <sstream>

namespace vestsale
{

Json::Value
ParseJson (const std::string& str)
{
  Json::Value val;
  std::istringstream in(str);
  in >> val;
  return val;
}

namespace
{

/**
 * Compares the values recursively.  The path is used to report the place
 * of the first mismatch in the log.
 */
bool
PartialEqualAt (const std::string& path,
                const Json::Value& actual, const Json::Value& expected)
{
  if (expected.isArray ())
    {
      if (!actual.isArray () || actual.size () != expected.size ())
        {
          LOG (ERROR)
              << "At " << path << ": expected array of size "
              << expected.size () << ", got:\n" << actual;
          return false;
        }

      for (unsigned i = 0; i < expected.size (); ++i)
        {
          std::ostringstream sub;
          sub << path << "[" << i << "]";
          if (!PartialEqualAt (sub.str (), actual[i], expected[i]))
            return false;
        }

      return true;
    }

  if (expected.isObject ())
    {
      if (!actual.isObject ())
        {
          LOG (ERROR) << "At " << path << ": expected object, got:\n" << actual;
          return false;
        }

      for (const auto& key : expected.getMemberNames ())
        {
          const std::string sub = path + "." + key;
          if (expected[key].isNull ())
            {
              if (actual.isMember (key))
                {
                  LOG (ERROR) << "At " << sub << ": member should be missing";
                  return false;
                }
              continue;
            }

          if (!actual.isMember (key))
            {
              LOG (ERROR) << "At " << sub << ": member is missing";
              return false;
            }

          if (!PartialEqualAt (sub, actual[key], expected[key]))
            return false;
        }

      return true;
    }

  if (expected.isString () && expected.asString () == "null")
    return actual.isNull ();

  if (actual.isInt64 () && expected.isInt64 ()
        && actual.asInt64 () == expected.asInt64 ())
    return true;
  if (actual.isUInt64 () && expected.isUInt64 ()
        && actual.asUInt64 () == expected.asUInt64 ())
    return true;

  if (actual == expected)
    return true;

  LOG (ERROR)
      << "At " << path << ": value\n" << actual
      << "\nis not equal to expected:\n" << expected;
  return false;
}

} // anonymous namespace

bool
PartialJsonEqual (const Json::Value& actual, const Json::Value& expected)
{
  return PartialEqualAt ("$", actual, expected);
}

} // namespace vestsale
