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

#ifndef VESTSALE_SALECONTROLLER_HPP
#define VESTSALE_SALECONTROLLER_HPP

#include "clock.hpp"
#include "interfaces.hpp"
#include "vestingledger.hpp"

#include "database/amount.hpp"
#include "database/database.hpp"
#include "database/issuance.hpp"
#include "proto/config.pb.h"

#include <functional>
#include <string>

namespace vestsale
{

/**
 * The stages a sale goes through.  NOT_STARTED leads to OPEN, which
 * ends either in CAP_REACHED or TIME_EXPIRED.  Only from those can the
 * sale be FINALISED.
 */
enum class SaleStage
{
  NOT_STARTED,
  OPEN,
  CAP_REACHED,
  TIME_EXPIRED,
  FINALISED,
};

/**
 * Returns the string name of a sale stage (e.g. for the JSON state).
 */
std::string SaleStageToString (SaleStage stage);

/**
 * The controller of a sale.  It checks and accepts contributions, converts
 * them into reward units and drives the vesting ledger for bonus
 * allocations.
 *
 * The state (parameters, total raised, administrator) is stored in the
 * database.  Reward balances, authorisation and vesting allocations are
 * handled through the bound collaborators.  Each operation runs inside
 * an SQLite savepoint, so that everything it did (also through the
 * collaborators, if they are based on the same database) is rolled back
 * if it throws.
 */
class SaleController
{

public:

  /**
   * Callback invoked once after the sale has been finalised.
   */
  using FinalisationHook = std::function<void ()>;

private:

  /** The underlying database.  */
  Database& db;

  /** Clock for the current time.  */
  const Clock& clock;

  /** The vesting ledger used for bonus allocations.  */
  VestingLedger* vesting;

  /** The ledger for reward units.  */
  RewardLedger* rewards;

  /** The authorisation oracle for contributors.  */
  const AuthorisationOracle* oracle;

  /** The finalisation hook, if any.  */
  FinalisationHook onFinalised;

  /**
   * Runs the admission check for a contribution.  Returns false and logs
   * the reason if it is not admitted.
   */
  bool CheckAdmission (const std::string& contributor, Amount amount,
                       int64_t now) const;

  /**
   * Advances the vesting interval and pays out all released amounts from
   * the controller account.  This expects a savepoint to be active.
   */
  bool ReleaseInternal (const std::string& controller, int64_t now);

  /**
   * Issues reward units (with the controller account as issuer) and
   * records them as issued through the given channel.  Zero amounts
   * are skipped.
   */
  void IssueUnits (const std::string& controller, const std::string& account,
                   Amount amount, IssuanceChannel channel);

  /**
   * Verifies that the caller is the sale administrator.
   */
  void CheckAdministrator (const std::string& caller) const;

  /**
   * Verifies that the caller is the administrator and the sale has not
   * yet started.  This is required for changing the collaborators.
   */
  void CheckRebind (const std::string& caller, int64_t now) const;

public:

  explicit SaleController (Database& d, const Clock& c,
                           VestingLedger& v, RewardLedger& r,
                           const AuthorisationOracle& o);

  SaleController () = delete;
  SaleController (const SaleController&) = delete;
  void operator= (const SaleController&) = delete;

  /**
   * Sets up the sale state in a fresh database.  Throws if the parameters
   * are inconsistent.
   */
  void Initialise (const std::string& administrator,
                   const proto::SaleParams& params);

  bool IsInitialised () const;

  /**
   * Sets the hook that is invoked after finalisation.
   */
  void SetFinalisationHook (FinalisationHook cb);

  /**
   * Returns true if a contribution would currently be admitted.
   */
  bool IsAdmitted (const std::string& contributor, Amount amount) const;

  /**
   * Accepts a contribution, issuing the reward units for it.  Throws
   * SaleError with NOT_ADMITTED if it fails the admission check.
   */
  void AcceptContribution (const std::string& contributor, Amount amount);

  /**
   * Issues reward units directly to a beneficiary (e.g. for contributions
   * made outside of the sale).
   */
  void DirectIssue (const std::string& caller, const std::string& beneficiary,
                    Amount rewardAmount);

  /**
   * Issues a bonus, part of which is vested through the vesting ledger.
   * Returns the index of the vesting allocation.
   */
  AllocationIndex CreateBonusAllocation (const std::string& caller,
                                         const std::string& beneficiary,
                                         Amount rewardAmount);

  /**
   * Moves the vesting ledger on to the next interval and pays out all
   * rewards due.  Returns false if the next interval has not been reached.
   */
  bool ReleaseVestedRewards (const std::string& caller);

  /**
   * Finalises the sale after it has ended.
   */
  void Finalise (const std::string& caller);

  void SetAuthorisationOracle (const std::string& caller,
                               const AuthorisationOracle& o);
  void SetVestingLedger (const std::string& caller, VestingLedger& v);
  void SetRewardLedger (const std::string& caller, RewardLedger& r);

  void SetCapacity (const std::string& caller, Amount capacity);
  void SetMaxContribution (const std::string& caller, Amount maxContribution);
  void SetEndTime (const std::string& caller, int64_t endTime);

  /**
   * Starts the transfer of the administrator role to a new account.
   * It has to be accepted by that account.
   */
  void TransferAdministrator (const std::string& caller,
                              const std::string& newAdmin);

  /**
   * Completes a pending transfer of the administrator role.
   */
  void AcceptAdministrator (const std::string& caller);

  SaleStage GetStage () const;

  /**
   * Returns true if the cap has been reached or the time window is over.
   */
  bool HasEnded () const;

  Amount GetTotalRaised () const;
  bool IsFinalised () const;
  std::string GetAdministrator () const;
  std::string GetPendingAdministrator () const;
  proto::SaleParams GetParams () const;

};

} // namespace vestsale

#endif // VESTSALE_SALECONTROLLER_HPP
