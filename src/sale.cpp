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

#include "sale.hpp"

#include "errors.hpp"

#include "database/savepoint.hpp"
#include "proto/saleconfig.hpp"

#include <glog/logging.h>

#include <string>
#include <vector>

namespace vestsale
{

Sale::Sale (Database& d, const Clock& c)
  : db(d), clock(c),
    rewards(db), whitelist(db), vesting(db, clock),
    controller(db, clock, vesting, rewards, whitelist)
{}

void
Sale::Initialise (const proto::SaleConfig& cfg)
{
  if (!ValidateSaleConfig (cfg))
    throw SaleError (ErrorCode::INVALID_ARGUMENT, "invalid sale config");

  LOG (INFO) << "Initialising sale for administrator " << cfg.administrator ();

  Savepoint sp(db, "initialise");

  const std::string& account = cfg.sale ().controller ();
  rewards.Initialise (account);
  vesting.Initialise (account, cfg.vesting ());
  controller.Initialise (cfg.administrator (), cfg.sale ());

  const std::vector<std::string> names(cfg.whitelist ().begin (),
                                       cfg.whitelist ().end ());
  whitelist.Add (cfg.administrator (), names);

  sp.Commit ();
}

bool
Sale::IsInitialised () const
{
  return controller.IsInitialised ();
}

} // namespace vestsale
