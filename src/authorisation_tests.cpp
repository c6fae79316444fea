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

#include "testutils.hpp"

#include "database/dbtest.hpp"
#include "database/salestate.hpp"

#include <gtest/gtest.h>

namespace vestsale
{
namespace
{

class WhitelistOracleTests : public DBTestWithSchema
{

protected:

  WhitelistOracle oracle;

  WhitelistOracleTests ()
    : oracle(db)
  {
    SaleStateTable tbl(db);
    tbl.Initialise ("admin", proto::SaleParams ());
  }

};

TEST_F (WhitelistOracleTests, AddAndRemove)
{
  EXPECT_FALSE (oracle.IsAuthorised ("alice"));

  EXPECT_EQ (oracle.Add ("admin", {"alice", "bob", "alice"}), 2);
  EXPECT_TRUE (oracle.IsAuthorised ("alice"));
  EXPECT_TRUE (oracle.IsAuthorised ("bob"));
  EXPECT_FALSE (oracle.IsAuthorised ("charly"));

  EXPECT_EQ (oracle.Remove ("admin", {"bob", "charly"}), 1);
  EXPECT_TRUE (oracle.IsAuthorised ("alice"));
  EXPECT_FALSE (oracle.IsAuthorised ("bob"));
}

TEST_F (WhitelistOracleTests, OnlyAdministrator)
{
  EXPECT_SALE_ERROR (oracle.Add ("alice", {"alice"}), ErrorCode::UNAUTHORIZED);
  EXPECT_FALSE (oracle.IsAuthorised ("alice"));

  oracle.Add ("admin", {"alice"});
  EXPECT_SALE_ERROR (oracle.Remove ("alice", {"alice"}),
                     ErrorCode::UNAUTHORIZED);
  EXPECT_TRUE (oracle.IsAuthorised ("alice"));
}

TEST_F (WhitelistOracleTests, FollowsAdministratorChange)
{
  SaleStateTable tbl(db);
  tbl.Get ()->SetAdministrator ("other");

  EXPECT_SALE_ERROR (oracle.Add ("admin", {"alice"}), ErrorCode::UNAUTHORIZED);
  EXPECT_EQ (oracle.Add ("other", {"alice"}), 1);
}

TEST_F (WhitelistOracleTests, BatchIsAtomic)
{
  EXPECT_SALE_ERROR (oracle.Add ("admin", {"alice", ""}),
                     ErrorCode::INVALID_ARGUMENT);
  EXPECT_FALSE (oracle.IsAuthorised ("alice"));
}

} // anonymous namespace
} // namespace vestsale
