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

#ifndef VESTSALE_SALE_HPP
#define VESTSALE_SALE_HPP

#include "authorisation.hpp"
#include "clock.hpp"
#include "rewardledger.hpp"
#include "salecontroller.hpp"
#include "vestingledger.hpp"

#include "database/database.hpp"
#include "proto/config.pb.h"

namespace vestsale
{

/**
 * All components of a sale running on one database:  The database-backed
 * reward ledger and whitelist, the vesting ledger and the controller
 * wired up to them.
 */
class Sale
{

private:

  /** The underlying database.  */
  Database& db;

  /** The clock used by all components.  */
  const Clock& clock;

  DbRewardLedger rewards;
  WhitelistOracle whitelist;
  VestingLedger vesting;
  SaleController controller;

public:

  explicit Sale (Database& d, const Clock& c);

  Sale () = delete;
  Sale (const Sale&) = delete;
  void operator= (const Sale&) = delete;

  /**
   * Sets up all components in a fresh database (with schema and money
   * supply already in place) from the given configuration.  Throws
   * SaleError if the configuration is invalid.
   */
  void Initialise (const proto::SaleConfig& cfg);

  bool IsInitialised () const;

  Database&
  GetDatabase ()
  {
    return db;
  }

  const Clock&
  GetClock () const
  {
    return clock;
  }

  DbRewardLedger&
  GetRewardLedger ()
  {
    return rewards;
  }

  WhitelistOracle&
  GetWhitelist ()
  {
    return whitelist;
  }

  VestingLedger&
  GetVestingLedger ()
  {
    return vesting;
  }

  SaleController&
  GetController ()
  {
    return controller;
  }

};

} // namespace vestsale

#endif // VESTSALE_SALE_HPP
