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

#ifndef VESTSALE_REWARDLEDGER_HPP
#define VESTSALE_REWARDLEDGER_HPP

#include "interfaces.hpp"

#include "database/database.hpp"

#include <string>

namespace vestsale
{

/**
 * RewardLedger implementation that keeps balances in the accounts table
 * of the database and its global state (issuer and frozen flag) in the
 * reward_ledger table.
 */
class DbRewardLedger : public RewardLedger
{

private:

  /** The underlying database.  */
  Database& db;

  /**
   * Verifies that the caller is the issuer and issuance is still
   * possible.  Throws otherwise.
   */
  void CheckIssuer (const std::string& caller, bool forIssuance) const;

public:

  explicit DbRewardLedger (Database& d)
    : db(d)
  {}

  /**
   * Sets up the ledger state in a fresh database, with the given account
   * as initial issuer.
   */
  void Initialise (const std::string& issuer);

  bool IsInitialised () const;

  std::string GetIssuer () const;
  bool IsFrozen () const;

  void Issue (const std::string& caller, const std::string& account,
              Amount amount) override;
  bool Transfer (const std::string& from, const std::string& to,
                 Amount amount) override;
  Amount BalanceOf (const std::string& account) const override;
  void FreezeIssuance (const std::string& caller) override;
  void SetIssuer (const std::string& caller,
                  const std::string& issuer) override;

};

} // namespace vestsale

#endif // VESTSALE_REWARDLEDGER_HPP
