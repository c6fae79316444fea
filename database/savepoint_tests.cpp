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

#include "dbtest.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

namespace vestsale
{
namespace
{

struct CountResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, cnt, 1);
};

class SavepointTests : public DBTestFixture
{

protected:

  SavepointTests ()
  {
    auto stmt = db.Prepare (R"(
      CREATE TABLE `test` (
        `id` INTEGER PRIMARY KEY
      )
    )");
    stmt.Execute ();
  }

  void
  Insert (const int64_t id)
  {
    auto stmt = db.Prepare ("INSERT INTO `test` (`id`) VALUES (?1)");
    stmt.Bind (1, id);
    stmt.Execute ();
  }

  int64_t
  CountRows ()
  {
    auto stmt = db.Prepare ("SELECT COUNT(*) AS `cnt` FROM `test`");
    auto res = stmt.Query<CountResult> ();
    CHECK (res.Step ());
    const int64_t cnt = res.Get<CountResult::cnt> ();
    CHECK (!res.Step ());
    return cnt;
  }

};

TEST_F (SavepointTests, Commit)
{
  {
    Savepoint sp(db, "test");
    Insert (1);
    Insert (2);
    sp.Commit ();
  }
  EXPECT_EQ (CountRows (), 2);
}

TEST_F (SavepointTests, RollbackWithoutCommit)
{
  Insert (1);
  {
    Savepoint sp(db, "test");
    Insert (2);
    Insert (3);
  }
  EXPECT_EQ (CountRows (), 1);

  /* The database is usable normally afterwards.  */
  Insert (4);
  EXPECT_EQ (CountRows (), 2);
}

TEST_F (SavepointTests, RollbackOnException)
{
  try
    {
      Savepoint sp(db, "test");
      Insert (1);
      throw std::runtime_error ("failure");
    }
  catch (const std::runtime_error& exc)
    {
      EXPECT_EQ (std::string (exc.what ()), "failure");
    }
  EXPECT_EQ (CountRows (), 0);
}

TEST_F (SavepointTests, Nested)
{
  {
    Savepoint outer(db, "outer");
    Insert (1);
    {
      Savepoint inner(db, "inner");
      Insert (2);
    }
    {
      Savepoint inner(db, "inner");
      Insert (3);
      inner.Commit ();
    }
    EXPECT_EQ (CountRows (), 2);
    outer.Commit ();
  }
  EXPECT_EQ (CountRows (), 2);

  {
    Savepoint outer(db, "outer");
    {
      Savepoint inner(db, "inner");
      Insert (10);
      inner.Commit ();
    }
  }
  EXPECT_EQ (CountRows (), 2);
}

TEST_F (SavepointTests, ExclusiveAcrossThreads)
{
  std::atomic<bool> opened(false);
  std::thread other;
  {
    Savepoint sp(db, "first");
    Insert (1);

    other = std::thread ([this, &opened] ()
      {
        Savepoint second(db, "second");
        opened = true;
        Insert (2);
        second.Commit ();
      });

    std::this_thread::sleep_for (std::chrono::milliseconds (20));
    EXPECT_FALSE (opened);
  }
  other.join ();

  /* The first savepoint has been rolled back without touching the changes
     of the second one.  */
  EXPECT_TRUE (opened);
  EXPECT_EQ (CountRows (), 1);

  auto stmt = db.Prepare ("SELECT `id` AS `cnt` FROM `test`");
  auto res = stmt.Query<CountResult> ();
  ASSERT_TRUE (res.Step ());
  EXPECT_EQ (res.Get<CountResult::cnt> (), 2);
}

} // anonymous namespace
} // namespace vestsale
