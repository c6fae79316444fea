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

#ifndef DATABASE_WHITELIST_HPP
#define DATABASE_WHITELIST_HPP

#include "database.hpp"

#include <string>

namespace vestsale
{

/**
 * Database result type for rows from the whitelist table.
 */
struct WhitelistResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, name, 1);
};

/**
 * Wrapper around the table of whitelisted accounts.
 */
class Whitelist
{

private:

  /** The underlying database handle.  */
  Database& db;

public:

  explicit Whitelist (Database& d)
    : db(d)
  {}

  Whitelist () = delete;
  Whitelist (const Whitelist&) = delete;
  void operator= (const Whitelist&) = delete;

  /**
   * Adds an account to the whitelist.  Returns false if it was already
   * on it.
   */
  bool Add (const std::string& name);

  /**
   * Removes an account.  Returns false if it was not whitelisted.
   */
  bool Remove (const std::string& name);

  /**
   * Checks whether the given account is on the whitelist.
   */
  bool Contains (const std::string& name);

  /**
   * Queries all whitelisted accounts, ordered by name.
   */
  Database::Result<WhitelistResult> QueryAll ();

};

} // namespace vestsale

#endif // DATABASE_WHITELIST_HPP
