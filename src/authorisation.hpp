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

#ifndef VESTSALE_AUTHORISATION_HPP
#define VESTSALE_AUTHORISATION_HPP

#include "interfaces.hpp"

#include "database/database.hpp"

#include <string>
#include <vector>

namespace vestsale
{

/**
 * AuthorisationOracle backed by the whitelist table.  Accounts can be added
 * and removed by the sale's current administrator.
 */
class WhitelistOracle : public AuthorisationOracle
{

private:

  /** The underlying database.  */
  Database& db;

  /**
   * Throws unless the caller is the sale administrator.
   */
  void CheckAdministrator (const std::string& caller) const;

public:

  explicit WhitelistOracle (Database& d)
    : db(d)
  {}

  bool IsAuthorised (const std::string& account) const override;

  /**
   * Adds the given accounts.  Returns the number of accounts that were
   * not yet on the whitelist.
   */
  unsigned Add (const std::string& caller,
                const std::vector<std::string>& accounts);

  /**
   * Removes the given accounts.  Returns the number of accounts that
   * were actually removed.
   */
  unsigned Remove (const std::string& caller,
                   const std::vector<std::string>& accounts);

};

} // namespace vestsale

#endif // VESTSALE_AUTHORISATION_HPP
