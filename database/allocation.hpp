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

#ifndef DATABASE_ALLOCATION_HPP
#define DATABASE_ALLOCATION_HPP

#include "amount.hpp"
#include "database.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace vestsale
{

/** Index of an allocation, which is also its stable identity.  */
using AllocationIndex = uint32_t;

/**
 * Database result type for rows from the allocations table.
 */
struct AllocationResult : public Database::ResultType
{
  RESULT_COLUMN (int64_t, idx, 1);
  RESULT_COLUMN (std::string, beneficiary, 2);
  RESULT_COLUMN (int64_t, total, 3);
  RESULT_COLUMN (int64_t, remaining, 4);
  RESULT_COLUMN (int64_t, last_claimed, 5);
  RESULT_COLUMN (int64_t, current_reward, 6);
};

/**
 * Wrapper class for one vesting allocation in the database.  Instances
 * are obtained through the AllocationsTable.  Changes are written back
 * when the handle is destructed.
 */
class Allocation
{

private:

  /** Database reference this belongs to.  */
  Database& db;

  /** The index of this allocation.  */
  AllocationIndex index;

  /** The beneficiary account.  */
  std::string beneficiary;

  /** The total amount, fixed at creation.  */
  Amount total;

  /** The amount not yet released.  */
  Amount remaining;

  /** The last interval at which this has been claimed.  */
  unsigned lastClaimed;

  /** The amount claimable in the current interval.  */
  Amount currentReward;

  /** Whether this is a new entry that needs to be inserted.  */
  bool isNew;

  /** Whether any fields have been modified.  */
  bool dirty;

  /**
   * Constructs a fresh allocation with the given index.
   */
  explicit Allocation (Database& d, AllocationIndex idx,
                       const std::string& b, Amount amount);

  /**
   * Constructs an instance based on the given DB result set.
   */
  explicit Allocation (Database& d,
                       const Database::Result<AllocationResult>& res);

  friend class AllocationsTable;

public:

  /**
   * In the destructor, the underlying database is updated if there are any
   * modifications to send.
   */
  ~Allocation ();

  Allocation () = delete;
  Allocation (const Allocation&) = delete;
  void operator= (const Allocation&) = delete;

  AllocationIndex
  GetIndex () const
  {
    return index;
  }

  const std::string&
  GetBeneficiary () const
  {
    return beneficiary;
  }

  Amount
  GetTotal () const
  {
    return total;
  }

  Amount
  GetRemaining () const
  {
    return remaining;
  }

  unsigned
  GetLastClaimedInterval () const
  {
    return lastClaimed;
  }

  Amount
  GetCurrentReward () const
  {
    return currentReward;
  }

  /**
   * Sets the remaining balance.  It must not increase, and not get
   * negative.
   */
  void SetRemaining (Amount val);

  /**
   * Marks the allocation as claimed in the given interval, which must
   * be larger than the previous one.
   */
  void SetLastClaimedInterval (unsigned interval);

  void SetCurrentReward (Amount val);

};

/**
 * Utility class that handles querying the allocations table in the database
 * and should be used to obtain Allocation instances.
 */
class AllocationsTable
{

private:

  /** The Database reference for creating queries.  */
  Database& db;

public:

  /** Movable handle to an allocation instance.  */
  using Handle = std::unique_ptr<Allocation>;

  explicit AllocationsTable (Database& d)
    : db(d)
  {}

  AllocationsTable () = delete;
  AllocationsTable (const AllocationsTable&) = delete;
  void operator= (const AllocationsTable&) = delete;

  /**
   * Creates a new allocation, which gets the next free index.  The entry is
   * inserted into the database when the handle is destructed.
   */
  Handle CreateNew (const std::string& beneficiary, Amount amount);

  /**
   * Returns a handle for the instance based on a Database::Result.
   */
  Handle GetFromResult (const Database::Result<AllocationResult>& res);

  /**
   * Returns the allocation with the given index, or null if there is none.
   */
  Handle GetByIndex (AllocationIndex idx);

  /**
   * Queries all allocations in order of their index.
   */
  Database::Result<AllocationResult> QueryAll ();

  /**
   * Returns the number of allocations.  Since indices are dense, this is
   * also the index the next allocation will get.
   */
  AllocationIndex Count ();

};

} // namespace vestsale

#endif // DATABASE_ALLOCATION_HPP
