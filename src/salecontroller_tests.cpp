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

#include "salecontroller.hpp"

#include "sale.hpp"
#include "statejson.hpp"
#include "testutils.hpp"

#include "database/auditlog.hpp"
#include "database/dbtest.hpp"
#include "database/issuance.hpp"
#include "proto/saleconfig.hpp"

#include <glog/logging.h>

#include <gtest/gtest.h>

#include <string>
#include <thread>

namespace vestsale
{
namespace
{

/**
 * Authorisation oracle that allows everyone.
 */
class AllowAllOracle : public AuthorisationOracle
{

public:

  bool
  IsAuthorised (const std::string& account) const override
  {
    return true;
  }

};

/**
 * Reward ledger that forwards to another one, except that all transfers
 * fail.
 */
class FailingTransferLedger : public RewardLedger
{

private:

  RewardLedger& base;

public:

  explicit FailingTransferLedger (RewardLedger& b)
    : base(b)
  {}

  void
  Issue (const std::string& caller, const std::string& account,
         const Amount amount) override
  {
    base.Issue (caller, account, amount);
  }

  bool
  Transfer (const std::string& from, const std::string& to,
            const Amount amount) override
  {
    return false;
  }

  Amount
  BalanceOf (const std::string& account) const override
  {
    return base.BalanceOf (account);
  }

  void
  FreezeIssuance (const std::string& caller) override
  {
    base.FreezeIssuance (caller);
  }

  void
  SetIssuer (const std::string& caller, const std::string& issuer) override
  {
    base.SetIssuer (caller, issuer);
  }

};

/**
 * Clock that moves on by one second every time it is read.
 */
class TickingClock : public Clock
{

private:

  mutable int64_t now;

public:

  explicit TickingClock (const int64_t t)
    : now(t)
  {}

  int64_t
  Now () const override
  {
    return now++;
  }

  void
  Set (const int64_t t)
  {
    now = t;
  }

};

/**
 * Returns the sale configuration used in the tests.
 */
proto::SaleConfig
TestConfig ()
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
    whitelist: "bob"
  )", cfg));
  return cfg;
}

class SaleControllerTests : public DBTestWithSchema
{

protected:

  FixedClock clock;
  Sale sale;
  SaleController& ctrl;

  SaleControllerTests ()
    : clock(50), sale(db, clock), ctrl(sale.GetController ())
  {
    sale.Initialise (TestConfig ());
  }

  Amount
  Balance (const std::string& name) const
  {
    return sale.GetRewardLedger ().BalanceOf (name);
  }

  unsigned
  CountAuditEntries ()
  {
    AuditLogTable log(db);
    auto res = log.QueryAll ();

    unsigned cnt = 0;
    while (res.Step ())
      ++cnt;

    return cnt;
  }

};

TEST_F (SaleControllerTests, Initialisation)
{
  EXPECT_TRUE (ctrl.IsInitialised ());
  EXPECT_EQ (ctrl.GetAdministrator (), "admin");
  EXPECT_EQ (ctrl.GetPendingAdministrator (), "");
  EXPECT_EQ (ctrl.GetTotalRaised (), 0);
  EXPECT_FALSE (ctrl.IsFinalised ());
  EXPECT_FALSE (ctrl.HasEnded ());
  EXPECT_TRUE (ctrl.GetStage () == SaleStage::NOT_STARTED);
  EXPECT_EQ (ctrl.GetParams ().capacity (), 1'000);
}

TEST_F (SaleControllerTests, StageTransitions)
{
  EXPECT_EQ (SaleStageToString (ctrl.GetStage ()), "not started");
  clock.Set (100);
  EXPECT_EQ (SaleStageToString (ctrl.GetStage ()), "open");
  clock.Set (200);
  EXPECT_EQ (SaleStageToString (ctrl.GetStage ()), "open");
  clock.Set (201);
  EXPECT_EQ (SaleStageToString (ctrl.GetStage ()), "time expired");
  EXPECT_TRUE (ctrl.HasEnded ());

  ctrl.Finalise ("admin");
  EXPECT_EQ (SaleStageToString (ctrl.GetStage ()), "finalised");
}

TEST_F (SaleControllerTests, Contribution)
{
  clock.Set (150);
  ctrl.AcceptContribution ("alice", 10);

  EXPECT_EQ (Balance ("alice"), 50);
  EXPECT_EQ (Balance ("share"), 10);
  EXPECT_EQ (ctrl.GetTotalRaised (), 10);

  IssuanceTable issuance(db);
  EXPECT_EQ (issuance.Get (IssuanceChannel::CONTRIBUTION), 50);
  EXPECT_EQ (issuance.Get (IssuanceChannel::ADMINISTRATOR), 10);

  AuditLogTable log(db);
  auto res = log.QueryForAccount ("alice");
  ASSERT_TRUE (res.Step ());
  auto entry = log.GetFromResult (res);
  EXPECT_TRUE (entry->GetType () == AuditEntry::Type::CONTRIBUTION);
  EXPECT_EQ (entry->GetAmount (), 10);
  EXPECT_EQ (entry->GetTime (), 150);
}

TEST_F (SaleControllerTests, AdmissionWindow)
{
  EXPECT_FALSE (ctrl.IsAdmitted ("alice", 10));
  EXPECT_SALE_ERROR (ctrl.AcceptContribution ("alice", 10),
                     ErrorCode::NOT_ADMITTED);

  clock.Set (100);
  EXPECT_TRUE (ctrl.IsAdmitted ("alice", 10));

  clock.Set (201);
  EXPECT_FALSE (ctrl.IsAdmitted ("alice", 10));
  EXPECT_SALE_ERROR (ctrl.AcceptContribution ("alice", 10),
                     ErrorCode::NOT_ADMITTED);

  EXPECT_EQ (Balance ("alice"), 0);
  EXPECT_EQ (CountAuditEntries (), 0);
}

TEST_F (SaleControllerTests, AdmissionAuthorisation)
{
  clock.Set (150);
  EXPECT_FALSE (ctrl.IsAdmitted ("charly", 10));
  EXPECT_SALE_ERROR (ctrl.AcceptContribution ("charly", 10),
                     ErrorCode::NOT_ADMITTED);

  sale.GetWhitelist ().Add ("admin", {"charly"});
  ctrl.AcceptContribution ("charly", 10);
  EXPECT_EQ (Balance ("charly"), 50);
}

TEST_F (SaleControllerTests, AdmissionBounds)
{
  clock.Set (150);

  EXPECT_FALSE (ctrl.IsAdmitted ("alice", 0));
  EXPECT_FALSE (ctrl.IsAdmitted ("alice", 101));
  EXPECT_FALSE (ctrl.IsAdmitted ("alice", -1));
  EXPECT_SALE_ERROR (ctrl.AcceptContribution ("alice", -1),
                     ErrorCode::INVALID_ARGUMENT);

  ctrl.AcceptContribution ("alice", 60);
  EXPECT_FALSE (ctrl.IsAdmitted ("alice", 41));
  EXPECT_SALE_ERROR (ctrl.AcceptContribution ("alice", 41),
                     ErrorCode::NOT_ADMITTED);

  ctrl.AcceptContribution ("alice", 40);
  EXPECT_EQ (Balance ("alice"), 500);
  EXPECT_FALSE (ctrl.IsAdmitted ("alice", 1));

  EXPECT_TRUE (ctrl.IsAdmitted ("bob", 100));
}

TEST_F (SaleControllerTests, CapEnforcement)
{
  ctrl.SetCapacity ("admin", 50);
  clock.Set (150);

  ctrl.AcceptContribution ("alice", 30);
  EXPECT_FALSE (ctrl.IsAdmitted ("bob", 21));
  EXPECT_SALE_ERROR (ctrl.AcceptContribution ("bob", 21),
                     ErrorCode::NOT_ADMITTED);

  ctrl.AcceptContribution ("bob", 20);
  EXPECT_EQ (ctrl.GetTotalRaised (), 50);
  EXPECT_TRUE (ctrl.GetStage () == SaleStage::CAP_REACHED);
  EXPECT_TRUE (ctrl.HasEnded ());

  EXPECT_FALSE (ctrl.IsAdmitted ("bob", 1));
  EXPECT_EQ (Balance ("bob"), 100);
}

TEST_F (SaleControllerTests, FailedContributionIsRolledBack)
{
  clock.Set (150);
  sale.GetRewardLedger ().SetIssuer ("sale", "other");

  EXPECT_SALE_ERROR (ctrl.AcceptContribution ("alice", 10),
                     ErrorCode::UNAUTHORIZED);

  EXPECT_EQ (ctrl.GetTotalRaised (), 0);
  EXPECT_EQ (Balance ("alice"), 0);
  EXPECT_EQ (Balance ("share"), 0);
  EXPECT_EQ (CountAuditEntries (), 0);
}

TEST_F (SaleControllerTests, DirectIssue)
{
  ctrl.DirectIssue ("admin", "carol", 100);

  EXPECT_EQ (Balance ("carol"), 100);
  EXPECT_EQ (Balance ("share"), 20);
  EXPECT_EQ (ctrl.GetTotalRaised (), 20);

  IssuanceTable issuance(db);
  EXPECT_EQ (issuance.Get (IssuanceChannel::DIRECT), 100);
  EXPECT_EQ (issuance.Get (IssuanceChannel::ADMINISTRATOR), 20);

  EXPECT_SALE_ERROR (ctrl.DirectIssue ("alice", "alice", 100),
                     ErrorCode::UNAUTHORIZED);
  EXPECT_SALE_ERROR (ctrl.DirectIssue ("admin", "carol", -5),
                     ErrorCode::INVALID_ARGUMENT);
  EXPECT_EQ (Balance ("alice"), 0);
}

TEST_F (SaleControllerTests, BonusAllocation)
{
  EXPECT_EQ (ctrl.CreateBonusAllocation ("admin", "carol", 100), 0);

  EXPECT_EQ (Balance ("share"), 20);
  EXPECT_EQ (Balance ("sale"), 50);
  EXPECT_EQ (Balance ("carol"), 50);
  EXPECT_EQ (ctrl.GetTotalRaised (), 0);

  auto& vesting = sale.GetVestingLedger ();
  ASSERT_EQ (vesting.Count (), 1);
  EXPECT_EQ (vesting.AllocationAmount (0), 50);

  IssuanceTable issuance(db);
  EXPECT_EQ (issuance.Get (IssuanceChannel::ADMINISTRATOR), 20);
  EXPECT_EQ (issuance.Get (IssuanceChannel::VESTING), 50);
  EXPECT_EQ (issuance.Get (IssuanceChannel::BONUS), 50);

  EXPECT_SALE_ERROR (ctrl.CreateBonusAllocation ("carol", "carol", 100),
                     ErrorCode::UNAUTHORIZED);
}

TEST_F (SaleControllerTests, BonusAfterUnlockIsRolledBack)
{
  clock.Set (300);
  EXPECT_SALE_ERROR (ctrl.CreateBonusAllocation ("admin", "carol", 100),
                     ErrorCode::SCHEDULE_CLOSED);

  EXPECT_EQ (Balance ("share"), 0);
  EXPECT_EQ (Balance ("sale"), 0);
  EXPECT_EQ (Balance ("carol"), 0);
  EXPECT_EQ (sale.GetVestingLedger ().Count (), 0);
}

TEST_F (SaleControllerTests, ReleaseVestedRewards)
{
  ctrl.CreateBonusAllocation ("admin", "carol", 2'002);
  ctrl.CreateBonusAllocation ("admin", "dave", 400);
  EXPECT_EQ (Balance ("carol"), 1'001);
  EXPECT_EQ (Balance ("dave"), 200);
  EXPECT_EQ (Balance ("sale"), 1'201);

  clock.Set (300);
  EXPECT_FALSE (ctrl.ReleaseVestedRewards ("admin"));

  clock.Set (301);
  EXPECT_SALE_ERROR (ctrl.ReleaseVestedRewards ("carol"),
                     ErrorCode::UNAUTHORIZED);
  EXPECT_TRUE (ctrl.ReleaseVestedRewards ("admin"));
  EXPECT_FALSE (ctrl.ReleaseVestedRewards ("admin"));
  EXPECT_EQ (Balance ("carol"), 1'001 + 250);
  EXPECT_EQ (Balance ("dave"), 200 + 50);

  for (const int64_t t : {351, 401, 451})
    {
      clock.Set (t);
      EXPECT_TRUE (ctrl.ReleaseVestedRewards ("admin"));
    }

  EXPECT_EQ (Balance ("carol"), 2'002);
  EXPECT_EQ (Balance ("dave"), 400);
  EXPECT_EQ (Balance ("sale"), 0);

  clock.Set (1'000);
  EXPECT_FALSE (ctrl.ReleaseVestedRewards ("admin"));
}

TEST_F (SaleControllerTests, FailedTransferIsRolledBack)
{
  FailingTransferLedger failing(sale.GetRewardLedger ());
  ctrl.SetRewardLedger ("admin", failing);

  ctrl.CreateBonusAllocation ("admin", "carol", 100);
  EXPECT_EQ (Balance ("sale"), 50);

  clock.Set (301);
  EXPECT_SALE_ERROR (ctrl.ReleaseVestedRewards ("admin"),
                     ErrorCode::TRANSFER_FAILED);

  EXPECT_EQ (sale.GetVestingLedger ().GetCurrentInterval (), 0);
  EXPECT_EQ (Balance ("sale"), 50);
  EXPECT_EQ (Balance ("carol"), 50);
}

TEST_F (SaleControllerTests, FinaliseRequiresEnd)
{
  EXPECT_SALE_ERROR (ctrl.Finalise ("admin"), ErrorCode::NOT_ENDED);
  clock.Set (150);
  EXPECT_SALE_ERROR (ctrl.Finalise ("admin"), ErrorCode::NOT_ENDED);

  clock.Set (201);
  EXPECT_SALE_ERROR (ctrl.Finalise ("alice"), ErrorCode::UNAUTHORIZED);
  EXPECT_FALSE (ctrl.IsFinalised ());

  ctrl.Finalise ("admin");
  EXPECT_TRUE (ctrl.IsFinalised ());
  EXPECT_TRUE (sale.GetRewardLedger ().IsFrozen ());
}

TEST_F (SaleControllerTests, FinaliseWhenCapReached)
{
  ctrl.SetCapacity ("admin", 10);
  clock.Set (150);
  ctrl.AcceptContribution ("alice", 10);

  ctrl.Finalise ("admin");
  EXPECT_TRUE (ctrl.GetStage () == SaleStage::FINALISED);
}

TEST_F (SaleControllerTests, FinaliseTwice)
{
  unsigned hookCalls = 0;
  ctrl.SetFinalisationHook ([&hookCalls] () { ++hookCalls; });

  ctrl.CreateBonusAllocation ("admin", "carol", 2'000);
  clock.Set (301);

  ctrl.Finalise ("admin");
  EXPECT_EQ (hookCalls, 1);
  EXPECT_EQ (Balance ("carol"), 1'000 + 250);
  EXPECT_EQ (sale.GetVestingLedger ().GetCurrentInterval (), 1);

  EXPECT_SALE_ERROR (ctrl.Finalise ("admin"), ErrorCode::ALREADY_FINALIZED);
  EXPECT_EQ (hookCalls, 1);
  EXPECT_EQ (Balance ("carol"), 1'000 + 250);
  EXPECT_EQ (sale.GetVestingLedger ().GetCurrentInterval (), 1);

  /* Vesting continues after finalisation.  */
  clock.Set (351);
  EXPECT_TRUE (ctrl.ReleaseVestedRewards ("admin"));
  EXPECT_EQ (Balance ("carol"), 1'000 + 500);
}

TEST_F (SaleControllerTests, NoIssuanceAfterFinalise)
{
  clock.Set (201);
  ctrl.Finalise ("admin");

  EXPECT_FALSE (ctrl.IsAdmitted ("alice", 10));
  EXPECT_SALE_ERROR (ctrl.DirectIssue ("admin", "carol", 100),
                     ErrorCode::SALE_FINALIZED);
  EXPECT_SALE_ERROR (ctrl.CreateBonusAllocation ("admin", "carol", 100),
                     ErrorCode::SALE_FINALIZED);
  EXPECT_SALE_ERROR (ctrl.SetCapacity ("admin", 2'000),
                     ErrorCode::SALE_FINALIZED);
}

TEST_F (SaleControllerTests, ParameterSetters)
{
  EXPECT_SALE_ERROR (ctrl.SetCapacity ("alice", 10), ErrorCode::UNAUTHORIZED);
  EXPECT_SALE_ERROR (ctrl.SetCapacity ("admin", 0),
                     ErrorCode::INVALID_ARGUMENT);
  ctrl.SetCapacity ("admin", 500);
  EXPECT_EQ (ctrl.GetParams ().capacity (), 500);

  EXPECT_SALE_ERROR (ctrl.SetMaxContribution ("admin", 0),
                     ErrorCode::INVALID_ARGUMENT);
  ctrl.SetMaxContribution ("admin", 1);
  EXPECT_EQ (ctrl.GetParams ().max_contribution (), 1);

  EXPECT_SALE_ERROR (ctrl.SetEndTime ("admin", 99),
                     ErrorCode::INVALID_ARGUMENT);
  ctrl.SetEndTime ("admin", 100);
  EXPECT_EQ (ctrl.GetParams ().end_time (), 100);

  EXPECT_EQ (ctrl.GetParams ().rate (), 5);
}

TEST_F (SaleControllerTests, Rebinding)
{
  AllowAllOracle allowAll;
  EXPECT_SALE_ERROR (ctrl.SetAuthorisationOracle ("alice", allowAll),
                     ErrorCode::UNAUTHORIZED);
  ctrl.SetAuthorisationOracle ("admin", allowAll);

  clock.Set (150);
  EXPECT_TRUE (ctrl.IsAdmitted ("charly", 10));

  const auto& whitelist = sale.GetWhitelist ();
  EXPECT_SALE_ERROR (ctrl.SetAuthorisationOracle ("admin", whitelist),
                     ErrorCode::SALE_STARTED);
  EXPECT_SALE_ERROR (ctrl.SetRewardLedger ("admin", sale.GetRewardLedger ()),
                     ErrorCode::SALE_STARTED);
  EXPECT_SALE_ERROR (ctrl.SetVestingLedger ("admin", sale.GetVestingLedger ()),
                     ErrorCode::SALE_STARTED);
}

TEST_F (SaleControllerTests, AdministratorTransfer)
{
  EXPECT_SALE_ERROR (ctrl.TransferAdministrator ("alice", "alice"),
                     ErrorCode::UNAUTHORIZED);
  EXPECT_SALE_ERROR (ctrl.AcceptAdministrator ("alice"),
                     ErrorCode::UNAUTHORIZED);

  ctrl.TransferAdministrator ("admin", "newadmin");
  EXPECT_EQ (ctrl.GetPendingAdministrator (), "newadmin");
  EXPECT_EQ (ctrl.GetAdministrator (), "admin");

  EXPECT_SALE_ERROR (ctrl.AcceptAdministrator ("alice"),
                     ErrorCode::UNAUTHORIZED);
  ctrl.AcceptAdministrator ("newadmin");
  EXPECT_EQ (ctrl.GetAdministrator (), "newadmin");
  EXPECT_EQ (ctrl.GetPendingAdministrator (), "");

  EXPECT_SALE_ERROR (ctrl.SetCapacity ("admin", 10), ErrorCode::UNAUTHORIZED);
  ctrl.SetCapacity ("newadmin", 10);
  sale.GetWhitelist ().Add ("newadmin", {"charly"});
}

TEST_F (SaleControllerTests, ConcurrentOperationsAreSerialised)
{
  clock.Set (150);
  constexpr int rounds = 50;

  std::thread contributions ([this] ()
    {
      for (int i = 0; i < rounds; ++i)
        ctrl.AcceptContribution ("alice", 1);
    });

  std::thread whitelisting ([this] ()
    {
      for (int i = 0; i < rounds; ++i)
        sale.GetWhitelist ().Add ("admin", {"user " + std::to_string (i)});
    });

  std::thread reader ([this] ()
    {
      StateJson converter(sale);
      for (int i = 0; i < rounds; ++i)
        {
          const auto issuance = converter.Issuance ();
          EXPECT_EQ (issuance["total"], issuance["balances"]);
        }
    });

  contributions.join ();
  whitelisting.join ();
  reader.join ();

  EXPECT_EQ (ctrl.GetTotalRaised (), rounds);
  EXPECT_EQ (Balance ("alice"), 5 * rounds);
  EXPECT_EQ (Balance ("share"), rounds);
  for (int i = 0; i < rounds; ++i)
    EXPECT_TRUE (sale.GetWhitelist ().IsAuthorised (
        "user " + std::to_string (i)));
}

/**
 * Tests with a clock that changes on every read.  Each controller
 * operation must see a single point in time.
 */
class SaleControllerTickingClockTests : public DBTestWithSchema
{

protected:

  TickingClock clock;
  Sale sale;
  SaleController& ctrl;

  SaleControllerTickingClockTests ()
    : clock(50), sale(db, clock), ctrl(sale.GetController ())
  {
    sale.Initialise (TestConfig ());
  }

};

TEST_F (SaleControllerTickingClockTests, BonusJustBeforeUnlock)
{
  clock.Set (299);
  EXPECT_EQ (ctrl.CreateBonusAllocation ("admin", "carol", 100), 0);

  AuditLogTable log(db);
  auto res = log.QueryAll ();
  while (res.Step ())
    EXPECT_EQ (log.GetFromResult (res)->GetTime (), 299);
}

TEST_F (SaleControllerTickingClockTests, FinaliseAtUnlock)
{
  clock.Set (150);
  ctrl.CreateBonusAllocation ("admin", "carol", 100);

  clock.Set (300);
  ctrl.Finalise ("admin");

  EXPECT_TRUE (ctrl.IsFinalised ());
  EXPECT_EQ (sale.GetVestingLedger ().GetCurrentInterval (), 0);
  EXPECT_EQ (sale.GetRewardLedger ().BalanceOf ("carol"), 50);
  EXPECT_EQ (sale.GetRewardLedger ().BalanceOf ("sale"), 50);
}

} // anonymous namespace
} // namespace vestsale
