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

#ifndef VESTSALE_STATEJSON_HPP
#define VESTSALE_STATEJSON_HPP

#include "sale.hpp"

#include "database/database.hpp"

#include <json/json.h>

namespace vestsale
{

/**
 * Utility class that handles construction of the sale-state JSON.  Each
 * method holds the database's operation lock, so that the returned data
 * is a consistent snapshot.
 */
class StateJson
{

private:

  /** The sale whose state is returned.  */
  Sale& sale;

  /** Database to read from.  */
  Database& db;

  /**
   * Extracts all results from the Database::Result instance, converts them
   * to JSON, and returns a JSON array.
   */
  template <typename T, typename R>
    Json::Value ResultsAsArray (T& tbl, Database::Result<R> res) const;

public:

  explicit StateJson (Sale& s)
    : sale(s), db(sale.GetDatabase ())
  {}

  StateJson () = delete;
  StateJson (const StateJson&) = delete;
  void operator= (const StateJson&) = delete;

  /**
   * Converts a database handle (like an Account or Allocation) to the
   * corresponding JSON value.
   */
  template <typename T>
    Json::Value Convert (const T& val) const;

  /**
   * Returns the sale parameters, stage and totals, as well as the state
   * of the reward ledger.
   */
  Json::Value SaleData ();

  /**
   * Returns the vesting schedule and all allocations.
   */
  Json::Value Vesting ();

  /**
   * Returns all accounts with their reward balances.
   */
  Json::Value Accounts ();

  /**
   * Returns the reward units issued through each channel, their total
   * and the sum of all account balances.
   */
  Json::Value Issuance ();

  /**
   * Returns the names of all whitelisted accounts.
   */
  Json::Value Whitelist ();

  /**
   * Returns the full audit log.
   */
  Json::Value AuditLog ();

  /**
   * Returns the entire state as JSON.
   */
  Json::Value FullState ();

};

} // namespace vestsale

#endif // VESTSALE_STATEJSON_HPP
