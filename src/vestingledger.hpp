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

#ifndef VESTSALE_VESTINGLEDGER_HPP
#define VESTSALE_VESTINGLEDGER_HPP

#include "clock.hpp"

#include "database/allocation.hpp"
#include "database/amount.hpp"
#include "database/database.hpp"
#include "proto/config.pb.h"

#include <string>

namespace vestsale
{

/**
 * Outcome of claiming a vesting allocation.
 */
struct ClaimResult
{

  /** Whether the amount has been released by this claim.  */
  bool release;

  /** The beneficiary of the allocation.  */
  std::string beneficiary;

  /**
   * The released amount, or the reward of the current interval if
   * nothing has been released.
   */
  Amount amount;

};

/**
 * The ledger of vesting allocations.  It keeps track of the global vesting
 * interval and of how much of each allocation has been released.  All
 * mutating operations are restricted to the ledger's administrator
 * and are atomic.
 *
 * The ledger does not move reward units itself.  The administrator (i.e.
 * the sale controller) transfers the amounts released by Claim.
 */
class VestingLedger
{

private:

  /** The underlying database.  */
  Database& db;

  /** Clock for the current time.  */
  const Clock& clock;

public:

  explicit VestingLedger (Database& d, const Clock& c)
    : db(d), clock(c)
  {}

  VestingLedger () = delete;
  VestingLedger (const VestingLedger&) = delete;
  void operator= (const VestingLedger&) = delete;

  /**
   * Sets up the vesting schedule in a fresh database.
   */
  void Initialise (const std::string& administrator,
                   const proto::VestingParams& params);

  bool IsInitialised () const;

  /**
   * Appends a new allocation for the beneficiary and returns its index.
   * This is only possible before the unlock date.
   */
  AllocationIndex CreateAllocation (const std::string& caller,
                                    const std::string& beneficiary,
                                    Amount amount);

  /**
   * Creates an allocation as if the current time were the given one.
   * This lets a caller run several ledger operations against a single
   * reading of the clock.
   */
  AllocationIndex CreateAllocation (const std::string& caller,
                                    const std::string& beneficiary,
                                    Amount amount, int64_t now);

  /**
   * Moves on to the next vesting interval if it has been reached and
   * computes the rewards claimable for it.  Returns false without any
   * change if that is not possible yet.
   */
  bool AdvanceInterval (const std::string& caller);
  bool AdvanceInterval (const std::string& caller, int64_t now);

  /**
   * Releases the reward of the current interval for the given allocation,
   * unless it has been claimed already in this interval.
   */
  ClaimResult Claim (const std::string& caller, AllocationIndex index);
  ClaimResult Claim (const std::string& caller, AllocationIndex index,
                     int64_t now);

  AllocationIndex Count () const;

  /**
   * Returns the total amount of the given allocation.
   */
  Amount AllocationAmount (AllocationIndex index) const;

  std::string GetAdministrator () const;
  unsigned GetCurrentInterval () const;
  unsigned GetNumIntervals () const;
  int64_t GetUnlockDate () const;
  int64_t GetIntervalDuration () const;

};

} // namespace vestsale

#endif // VESTSALE_VESTINGLEDGER_HPP
