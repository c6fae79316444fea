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

#include "authorisation.hpp"

#include "errors.hpp"

#include "database/salestate.hpp"
#include "database/savepoint.hpp"
#include "database/whitelist.hpp"

#include <glog/logging.h>

namespace vestsale
{

void
WhitelistOracle::CheckAdministrator (const std::string& caller) const
{
  SaleStateTable tbl(db);
  if (caller != tbl.Get ()->GetAdministrator ())
    throw SaleError (ErrorCode::UNAUTHORIZED,
                     caller + " may not change the whitelist");
}

bool
WhitelistOracle::IsAuthorised (const std::string& account) const
{
  auto lock = db.LockOperations ();

  Whitelist wl(db);
  return wl.Contains (account);
}

unsigned
WhitelistOracle::Add (const std::string& caller,
                      const std::vector<std::string>& accounts)
{
  Savepoint sp(db, "whitelist_add");
  CheckAdministrator (caller);

  Whitelist wl(db);
  unsigned added = 0;
  for (const auto& a : accounts)
    {
      if (a.empty ())
        throw SaleError (ErrorCode::INVALID_ARGUMENT, "empty account name");
      if (wl.Add (a))
        ++added;
    }

  sp.Commit ();
  LOG (INFO) << "Added " << added << " accounts to the whitelist";

  return added;
}

unsigned
WhitelistOracle::Remove (const std::string& caller,
                         const std::vector<std::string>& accounts)
{
  Savepoint sp(db, "whitelist_remove");
  CheckAdministrator (caller);

  Whitelist wl(db);
  unsigned removed = 0;
  for (const auto& a : accounts)
    if (wl.Remove (a))
      ++removed;

  sp.Commit ();
  LOG (INFO) << "Removed " << removed << " accounts from the whitelist";

  return removed;
}

} // namespace vestsale
