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

#include "savepoint.hpp"

#include <glog/logging.h>

namespace vestsale
{

Savepoint::Savepoint (Database& d, const std::string& n)
  : db(d), lock(db.LockOperations ()), name(n)
{
  VLOG (2) << "Opening savepoint " << name;
  ExecuteForName ("SAVEPOINT");
}

Savepoint::~Savepoint ()
{
  if (committed)
    return;

  VLOG (1) << "Rolling back changes of savepoint " << name;
  ExecuteForName ("ROLLBACK TO");
  ExecuteForName ("RELEASE");
}

void
Savepoint::ExecuteForName (const std::string& cmd)
{
  auto stmt = db.Prepare (cmd + " `" + name + "`");
  stmt.Execute ();
}

void
Savepoint::Commit ()
{
  CHECK (!committed) << "Savepoint " << name << " committed twice";
  VLOG (2) << "Committing savepoint " << name;
  ExecuteForName ("RELEASE");
  committed = true;
}

} // namespace vestsale
