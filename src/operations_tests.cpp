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

#include "operations.hpp"

#include "testutils.hpp"

#include "database/dbtest.hpp"
#include "proto/saleconfig.hpp"

#include <glog/logging.h>

#include <gtest/gtest.h>

namespace vestsale
{
namespace
{

class OperationProcessorTests : public DBTestWithSchema
{

protected:

  FixedClock clock;
  Sale sale;
  OperationProcessor proc;

  OperationProcessorTests ()
    : clock(150), sale(db, clock), proc(sale)
  {
    proto::SaleConfig cfg;
    CHECK (ParseSaleConfig (R"(
      administrator: "admin"
      sale:
        {
          start_time: 100
          end_time: 200
          capacity: 1000
          min_contribution: 1
          max_contribution: 100
          rate: 5
          administrator_rate: 1
          bonus_percent: 50
          share_account: "share"
          controller: "sale"
        }
      vesting:
        {
          unlock_date: 300
          interval_duration: 50
          num_intervals: 4
        }
      whitelist: "alice"
    )", cfg));
    sale.Initialise (cfg);
  }

  /**
   * Processes the given operations (as JSON string) and checks the
   * results against the expected JSON.
   */
  void
  ExpectResults (const std::string& ops, const std::string& expected)
  {
    const Json::Value actual = proc.ProcessAll (ParseJson (ops));
    ASSERT_TRUE (actual.isArray ());
    ASSERT_EQ (actual.size (), ParseJson (ops).size ());
    EXPECT_TRUE (PartialJsonEqual (actual, ParseJson (expected)));
  }

  Amount
  Balance (const std::string& name) const
  {
    return sale.GetRewardLedger ().BalanceOf (name);
  }

};

TEST_F (OperationProcessorTests, Malformed)
{
  ExpectResults (R"([
    42,
    {},
    {"name": "", "op": {"contribute": 10}},
    {"name": 5, "op": {"contribute": 10}},
    {"name": "alice", "op": "contribute"},
    {"name": "alice", "op": {}},
    {"name": "alice", "op": {"contribute": 10, "finalise": true}},
    {"name": "alice", "op": {"contribute": -1}},
    {"name": "alice", "op": {"contribute": 1.5}},
    {"name": "alice", "op": {"contribute": "10"}},
    {"name": "alice", "op": {"foo": 10}},
    {"name": "admin", "op": {"release": false}},
    {"name": "admin", "op": {"finalise": 1}},
    {"name": "admin", "op": {"direct": {"to": "bob"}}},
    {"name": "admin", "op": {"bonus": {"to": "", "amount": 10}}},
    {"name": "admin", "op": {"bonus": {"to": "bob", "value": 10}}},
    {"name": "admin", "op": {"whitelist": {"add": "bob"}}},
    {"name": "admin", "op": {"whitelist": {"add": ["bob", 5]}}},
    {"name": "admin", "op": {"whitelist": {"clear": []}}},
    {"name": "admin", "op": {"config": {"rate": 10}}},
    {"name": "admin", "op": {"config": {"capacity": -10}}},
    {"name": "admin", "op": {"admin": {"transfer": ""}}},
    {"name": "admin", "op": {"admin": {"accept": false}}}
  ])", R"([
    {"success": false, "malformed": true},
    {"success": false, "malformed": true},
    {"success": false, "malformed": true},
    {"success": false, "malformed": true},
    {"success": false, "malformed": true},
    {"success": false, "malformed": true},
    {"success": false, "malformed": true},
    {"success": false, "malformed": true, "type": "contribute"},
    {"success": false, "malformed": true, "type": "contribute"},
    {"success": false, "malformed": true, "type": "contribute"},
    {"success": false, "malformed": true, "type": "foo"},
    {"success": false, "malformed": true, "type": "release"},
    {"success": false, "malformed": true, "type": "finalise"},
    {"success": false, "malformed": true, "type": "direct"},
    {"success": false, "malformed": true, "type": "bonus"},
    {"success": false, "malformed": true, "type": "bonus"},
    {"success": false, "malformed": true, "type": "whitelist"},
    {"success": false, "malformed": true, "type": "whitelist"},
    {"success": false, "malformed": true, "type": "whitelist"},
    {"success": false, "malformed": true, "type": "config"},
    {"success": false, "malformed": true, "type": "config"},
    {"success": false, "malformed": true, "type": "admin"},
    {"success": false, "malformed": true, "type": "admin"}
  ])");

  EXPECT_EQ (Balance ("alice"), 0);
  EXPECT_EQ (sale.GetController ().GetTotalRaised (), 0);
}

TEST_F (OperationProcessorTests, Contribution)
{
  ExpectResults (R"([
    {"name": "alice", "op": {"contribute": 10}},
    {"name": "bob", "op": {"contribute": 10}}
  ])", R"([
    {"success": true, "name": "alice", "type": "contribute", "error": null},
    {
      "success": false,
      "name": "bob",
      "type": "contribute",
      "error": "not admitted",
      "code": 8
    }
  ])");

  EXPECT_EQ (Balance ("alice"), 50);
  EXPECT_EQ (Balance ("share"), 10);
  EXPECT_EQ (Balance ("bob"), 0);
}

TEST_F (OperationProcessorTests, DirectAndBonus)
{
  ExpectResults (R"([
    {"name": "admin", "op": {"direct": {"to": "bob", "amount": 100}}},
    {"name": "admin", "op": {"bonus": {"to": "bob", "amount": 100}}},
    {"name": "admin", "op": {"bonus": {"to": "carol", "amount": 10}}},
    {"name": "bob", "op": {"direct": {"to": "bob", "amount": 100}}}
  ])", R"([
    {"success": true, "type": "direct", "allocation": null},
    {"success": true, "type": "bonus", "allocation": 0},
    {"success": true, "type": "bonus", "allocation": 1},
    {"success": false, "type": "direct", "error": "unauthorized"}
  ])");

  EXPECT_EQ (Balance ("bob"), 150);
  EXPECT_EQ (Balance ("carol"), 5);
  EXPECT_EQ (Balance ("sale"), 55);
}

TEST_F (OperationProcessorTests, ReleaseAndFinalise)
{
  proc.ProcessOne (ParseJson (R"(
    {"name": "admin", "op": {"bonus": {"to": "bob", "amount": 800}}}
  )"));

  ExpectResults (R"([
    {"name": "admin", "op": {"release": true}},
    {"name": "admin", "op": {"finalise": true}}
  ])", R"([
    {"success": true, "type": "release", "released": false},
    {"success": false, "type": "finalise", "error": "not ended"}
  ])");

  clock.Set (301);
  ExpectResults (R"([
    {"name": "admin", "op": {"finalise": true}},
    {"name": "admin", "op": {"release": true}},
    {"name": "admin", "op": {"finalise": true}}
  ])", R"([
    {"success": true, "type": "finalise"},
    {"success": true, "type": "release", "released": false},
    {"success": false, "type": "finalise", "error": "already finalized"}
  ])");

  EXPECT_EQ (Balance ("bob"), 400 + 100);
  EXPECT_TRUE (sale.GetController ().IsFinalised ());
}

TEST_F (OperationProcessorTests, Whitelist)
{
  ExpectResults (R"([
    {"name": "admin", "op": {"whitelist": {"add": ["bob", "carol", "bob"]}}},
    {"name": "admin", "op": {"whitelist": {"remove": ["alice", "dave"]}}},
    {"name": "bob", "op": {"whitelist": {"add": ["dave"]}}}
  ])", R"([
    {"success": true, "changed": 2},
    {"success": true, "changed": 1},
    {"success": false, "error": "unauthorized"}
  ])");

  const auto& wl = sale.GetWhitelist ();
  EXPECT_FALSE (wl.IsAuthorised ("alice"));
  EXPECT_TRUE (wl.IsAuthorised ("bob"));
  EXPECT_TRUE (wl.IsAuthorised ("carol"));
  EXPECT_FALSE (wl.IsAuthorised ("dave"));
}

TEST_F (OperationProcessorTests, Config)
{
  ExpectResults (R"([
    {"name": "admin", "op": {"config": {"capacity": 500}}},
    {"name": "admin", "op": {"config": {"max": 50}}},
    {"name": "admin", "op": {"config": {"end": 250}}},
    {"name": "admin", "op": {"config": {"end": 50}}},
    {"name": "alice", "op": {"config": {"capacity": 5}}}
  ])", R"([
    {"success": true},
    {"success": true},
    {"success": true},
    {"success": false, "error": "invalid argument"},
    {"success": false, "error": "unauthorized"}
  ])");

  const auto& params = sale.GetController ().GetParams ();
  EXPECT_EQ (params.capacity (), 500);
  EXPECT_EQ (params.max_contribution (), 50);
  EXPECT_EQ (params.end_time (), 250);
}

TEST_F (OperationProcessorTests, AdministratorTransfer)
{
  ExpectResults (R"([
    {"name": "admin", "op": {"admin": {"transfer": "bob"}}},
    {"name": "alice", "op": {"admin": {"accept": true}}},
    {"name": "bob", "op": {"admin": {"accept": true}}},
    {"name": "admin", "op": {"config": {"capacity": 5}}}
  ])", R"([
    {"success": true},
    {"success": false, "error": "unauthorized"},
    {"success": true},
    {"success": false, "error": "unauthorized"}
  ])");

  EXPECT_EQ (sale.GetController ().GetAdministrator (), "bob");
}

} // anonymous namespace
} // namespace vestsale
