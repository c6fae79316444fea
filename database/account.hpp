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

#ifndef DATABASE_ACCOUNT_HPP
#define DATABASE_ACCOUNT_HPP

#include "amount.hpp"
#include "database.hpp"

#include <memory>
#include <string>

namespace vestsale
{

/**
 * Database result type for rows from the accounts table.
 */
struct AccountResult : public Database::ResultType
{
  RESULT_COLUMN (std::string, name, 1);
  RESULT_COLUMN (int64_t, balance, 2);
};

/**
 * Wrapper class around the reward-unit balance of one account in the
 * database.  Instantiations of this class should be made through the
 * AccountsTable.
 */
class Account
{

private:

  /** Database reference this belongs to.  */
  Database& db;

  /** The name of this account.  */
  std::string name;

  /** The current balance.  */
  Amount balance;

  /** Whether or not this has been modified.  */
  bool dirty;

  /**
   * Constructs an instance with zero balance for the given name.
   */
  explicit Account (Database& d, const std::string& n);

  /**
   * Constructs an instance based on the given DB result set.  The result
   * set should be constructed by an AccountsTable.
   */
  explicit Account (Database& d, const Database::Result<AccountResult>& res);

  friend class AccountsTable;

public:

  /**
   * In the destructor, the underlying database is updated if there are any
   * modifications to send.
   */
  ~Account ();

  Account () = delete;
  Account (const Account&) = delete;
  void operator= (const Account&) = delete;

  const std::string&
  GetName () const
  {
    return name;
  }

  Amount
  GetBalance () const
  {
    return balance;
  }

  /**
   * Updates the account balance by the given (signed) amount.  The
   * resulting balance must not be negative.
   */
  void AddBalance (Amount val);

};

/**
 * Utility class that handles querying the accounts table in the database and
 * should be used to obtain Account instances.
 */
class AccountsTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Movable handle to an account instance.  */
  using Handle = std::unique_ptr<Account>;

  explicit AccountsTable (Database& d)
    : db(d)
  {}

  AccountsTable () = delete;
  AccountsTable (const AccountsTable&) = delete;
  void operator= (const AccountsTable&) = delete;

  /**
   * Creates a new entry in the database for the given name.
   * Calling this method for a name that already has an account is an error.
   */
  Handle CreateNew (const std::string& name);

  /**
   * Returns a handle for the instance based on a Database::Result.
   */
  Handle GetFromResult (const Database::Result<AccountResult>& res);

  /**
   * Returns the account with the given name, or null if there is none.
   */
  Handle GetByName (const std::string& name);

  /**
   * Returns the account with the given name, creating a fresh one (with
   * zero balance) if it does not exist yet.
   */
  Handle GetOrCreate (const std::string& name);

  /**
   * Queries the database for all accounts, ordered by name.
   */
  Database::Result<AccountResult> QueryAll ();

  /**
   * Returns the sum of all balances.
   */
  Amount GetTotalBalance ();

};

} // namespace vestsale

#endif // DATABASE_ACCOUNT_HPP
