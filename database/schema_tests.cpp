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

#include "schema.hpp"

#include "dbtest.hpp"

#include <gtest/gtest.h>

namespace vestsale
{
namespace
{

using SchemaTests = DBTestFixture;

TEST_F (SchemaTests, Works)
{
  SetupDatabaseSchema (db.GetHandle ());
}

TEST_F (SchemaTests, TwiceIsOk)
{
  SetupDatabaseSchema (db.GetHandle ());
  SetupDatabaseSchema (db.GetHandle ());
}

TEST_F (SchemaTests, SingleRowTables)
{
  SetupDatabaseSchema (db.GetHandle ());

  auto stmt = db.Prepare (R"(
    INSERT INTO `reward_ledger`
      (`id`, `issuer`, `frozen`) VALUES (1, 'sale', 0)
  )");
  stmt.Execute ();

  EXPECT_DEATH (
    {
      auto other = db.Prepare (R"(
        INSERT INTO `reward_ledger`
          (`id`, `issuer`, `frozen`) VALUES (2, 'other', 0)
      )");
      other.Execute ();
    }, "CHECK constraint failed");
}

} // anonymous namespace
} // namespace vestsale
