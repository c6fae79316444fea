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

#ifndef VESTSALE_INTERFACES_HPP
#define VESTSALE_INTERFACES_HPP

#include "database/amount.hpp"

#include <string>

namespace vestsale
{

/**
 * Registry that decides which accounts may contribute to the sale.
 */
class AuthorisationOracle
{

public:

  AuthorisationOracle () = default;
  virtual ~AuthorisationOracle () = default;

  AuthorisationOracle (const AuthorisationOracle&) = delete;
  void operator= (const AuthorisationOracle&) = delete;

  virtual bool IsAuthorised (const std::string& account) const = 0;

};

/**
 * Ledger holding the balances of reward units.  The sale core issues and
 * transfers units through it but never stores balances itself.
 *
 * Failing calls (other than a soft-failed Transfer) throw SaleError.
 */
class RewardLedger
{

public:

  RewardLedger () = default;
  virtual ~RewardLedger () = default;

  RewardLedger (const RewardLedger&) = delete;
  void operator= (const RewardLedger&) = delete;

  /**
   * Issues new units to the given account.  Only the configured issuer
   * may do that, and only until issuance is frozen.
   */
  virtual void Issue (const std::string& caller, const std::string& account,
                      Amount amount) = 0;

  /**
   * Moves units between accounts.  Returns false (without any change)
   * if the sender does not have enough units or the amount is invalid.
   */
  virtual bool Transfer (const std::string& from, const std::string& to,
                         Amount amount) = 0;

  virtual Amount BalanceOf (const std::string& account) const = 0;

  /**
   * Permanently disables issuance.  Only the issuer may do that.
   */
  virtual void FreezeIssuance (const std::string& caller) = 0;

  /**
   * Hands over the issuer role.  Only the current issuer may do that.
   */
  virtual void SetIssuer (const std::string& caller,
                          const std::string& issuer) = 0;

};

} // namespace vestsale

#endif // VESTSALE_INTERFACES_HPP
