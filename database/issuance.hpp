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
#ifndef DATABASE_ISSUANCE_HPP
#define DATABASE_ISSUANCE_HPP

#include "amount.hpp"
#include "database.hpp"

#include <string>
#include <vector>

namespace vestsale
{

/**
 * The channels through which reward units enter circulation.
 */
enum class IssuanceChannel
{
  /** Units issued to contributors for accepted contributions.  */
  CONTRIBUTION = 1,
  /** The administrator share of every issuance.  */
  ADMINISTRATOR = 2,
  /** Units issued directly by the administrator.  */
  DIRECT = 3,
  /** The immediate part of bonus allocations.  */
  BONUS = 4,
  /** Units reserved for vesting allocations.  */
  VESTING = 5,
};

/**
 * Returns the name of an issuance channel as used in the JSON state.
 */
std::string IssuanceChannelToString (IssuanceChannel c);

/**
 * Accounting of the reward units issued through each channel.  Since
 * units only ever move between accounts after being issued, the total
 * recorded here matches the sum of all account balances.
 */
class IssuanceTable
{

private:

  /** The underlying database handle.  */
  Database& db;

public:

  explicit IssuanceTable (Database& d)
    : db(d)
  {}

  IssuanceTable () = delete;
  IssuanceTable (const IssuanceTable&) = delete;
  void operator= (const IssuanceTable&) = delete;

  /**
   * Records that the given (positive) amount has been issued through
   * a channel.
   */
  void Record (IssuanceChannel c, Amount amount);

  /**
   * Returns the amount issued through a channel so far.
   */
  Amount Get (IssuanceChannel c);

  /**
   * Returns the amount issued through all channels together.
   */
  Amount GetTotal ();

  /**
   * Returns all channels in their canonical order.
   */
  static const std::vector<IssuanceChannel>& GetChannels ();

};

} // namespace vestsale

#endif // DATABASE_ISSUANCE_HPP
