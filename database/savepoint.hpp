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

#ifndef DATABASE_SAVEPOINT_HPP
#define DATABASE_SAVEPOINT_HPP

#include "database.hpp"

#include <string>

namespace vestsale
{

/**
 * RAII object that opens an SQLite savepoint when constructed.  Unless
 * Commit is called before it goes out of scope, all changes made to the
 * database since then are rolled back when it is destructed.  This is used
 * to make each sale operation atomic:  If it throws half-way through, none
 * of its changes remain.
 *
 * Savepoints can be nested.  Changes committed by an inner savepoint are
 * still rolled back if the outer one is not committed.
 *
 * A savepoint holds the database's operation lock for its lifetime, so
 * savepoints opened by different threads never interleave.
 */
class Savepoint
{

private:

  /** Underlying database handle.  */
  Database& db;

  /** The operation lock, held until the savepoint is destructed.  */
  Database::OperationLock lock;

  /** Name of the savepoint (for logging and the SQL statements).  */
  std::string name;

  /** Set to true when the changes have been committed.  */
  bool committed = false;

  /**
   * Executes a simple statement that refers to our savepoint.
   */
  void ExecuteForName (const std::string& cmd);

public:

  explicit Savepoint (Database& d, const std::string& n);

  /**
   * Rolls back the changes if they have not been committed.
   */
  ~Savepoint ();

  Savepoint () = delete;
  Savepoint (const Savepoint&) = delete;
  void operator= (const Savepoint&) = delete;

  /**
   * Releases the savepoint, keeping all changes made (as part of the
   * enclosing savepoint or transaction, if any).
   */
  void Commit ();

};

} // namespace vestsale

#endif // DATABASE_SAVEPOINT_HPP
