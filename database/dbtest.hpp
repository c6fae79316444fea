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

#ifndef DATABASE_DBTEST_HPP
#define DATABASE_DBTEST_HPP

#include "database.hpp"
#include "savepoint.hpp"

#include <xayagame/sqlitestorage.hpp>

#include <gtest/gtest.h>

#include <benchmark/benchmark.h>

#include <sqlite3.h>

#include <memory>

namespace vestsale
{

/**
 * Database instance that uses an in-memory SQLite.  That way, we can run
 * tests and benchmarks without touching the file system.
 */
class TestDatabase : public Database
{

private:

  /** The SQLiteDatabase instance.  */
  xaya::SQLiteDatabase db;

public:

  TestDatabase ();

  TestDatabase (const TestDatabase&) = delete;
  void operator= (const TestDatabase&) = delete;

  /**
   * Returns the underlying database handle for SQLite.
   */
  sqlite3*
  GetHandle ()
  {
    return *db;
  }

};

/**
 * Test fixture that has a TestDatabase inside.
 */
class DBTestFixture : public testing::Test
{

protected:

  /** The database instance to use.  */
  TestDatabase db;

  DBTestFixture () = default;

};

/**
 * Test fixture that opens an in-memory database and also installs the
 * schema in it.
 */
class DBTestWithSchema : public DBTestFixture
{

protected:

  DBTestWithSchema ();

};

/**
 * RAII object that keeps a savepoint open and rolls it back when
 * destructed, with the benchmark timers paused for both steps.  Benchmarks
 * use it to run each iteration of their loop on the same database state.
 */
class TemporaryDatabaseChanges
{

private:

  /** Benchmark state for pausing the timers.  */
  benchmark::State& benchmarkState;

  /** The savepoint, which is never committed.  */
  std::unique_ptr<Savepoint> changes;

public:

  /**
   * Constructs the object.  This checkpoints the database state.
   */
  explicit TemporaryDatabaseChanges (Database& d, benchmark::State& s);

  /**
   * Destructs the object, restoring the checkpointed state.
   */
  ~TemporaryDatabaseChanges ();

  TemporaryDatabaseChanges () = delete;
  TemporaryDatabaseChanges (const TemporaryDatabaseChanges&) = delete;
  void operator= (const TemporaryDatabaseChanges&) = delete;

};

} // namespace vestsale

#endif // DATABASE_DBTEST_HPP
