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

#include "whitelist.hpp"

#include <glog/logging.h>

namespace vestsale
{

bool
Whitelist::Add (const std::string& name)
{
  if (Contains (name))
    return false;

  VLOG (1) << "Adding " << name << " to the whitelist";
  auto stmt = db.Prepare (R"(
    INSERT INTO `whitelist`
      (`name`) VALUES (?1)
  )");
  stmt.Bind (1, name);
  stmt.Execute ();

  return true;
}

bool
Whitelist::Remove (const std::string& name)
{
  if (!Contains (name))
    return false;

  VLOG (1) << "Removing " << name << " from the whitelist";
  auto stmt = db.Prepare (R"(
    DELETE FROM `whitelist`
      WHERE `name` = ?1
  )");
  stmt.Bind (1, name);
  stmt.Execute ();

  return true;
}

bool
Whitelist::Contains (const std::string& name)
{
  auto stmt = db.Prepare (R"(
    SELECT `name`
      FROM `whitelist`
      WHERE `name` = ?1
  )");
  stmt.Bind (1, name);

  auto res = stmt.Query<WhitelistResult> ();
  if (!res.Step ())
    return false;

  CHECK (!res.Step ());
  return true;
}

Database::Result<WhitelistResult>
Whitelist::QueryAll ()
{
  auto stmt = db.Prepare (R"(
    SELECT `name`
      FROM `whitelist`
      ORDER BY `name`
  )");
  return stmt.Query<WhitelistResult> ();
}

} // namespace vestsale
