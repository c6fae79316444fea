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

#include "saleconfig.hpp"

#include "database/amount.hpp"

#include <google/protobuf/text_format.h>

#include <glog/logging.h>

#include <fstream>
#include <sstream>

namespace vestsale
{

namespace
{

/**
 * Returns true if the value is a valid amount.
 */
bool
IsAmount (const int64_t val)
{
  return val >= 0 && val <= MAX_AMOUNT;
}

} // anonymous namespace

bool
ParseSaleConfig (const std::string& text, proto::SaleConfig& cfg)
{
  if (!google::protobuf::TextFormat::ParseFromString (text, &cfg))
    {
      LOG (WARNING) << "Failed to parse sale config";
      return false;
    }

  return true;
}

bool
LoadSaleConfig (const std::string& file, proto::SaleConfig& cfg)
{
  std::ifstream in(file);
  if (!in)
    {
      LOG (WARNING) << "Could not open config file " << file;
      return false;
    }

  std::ostringstream text;
  text << in.rdbuf ();

  LOG (INFO) << "Loading sale config from " << file;
  return ParseSaleConfig (text.str (), cfg);
}

bool
ValidateSaleParams (const proto::SaleParams& params)
{
  if (params.end_time () < params.start_time ())
    {
      LOG (WARNING) << "Sale ends before it starts";
      return false;
    }

  if (params.capacity () <= 0 || !IsAmount (params.capacity ()))
    {
      LOG (WARNING) << "Invalid sale capacity: " << params.capacity ();
      return false;
    }

  if (params.rate () <= 0 || !IsAmount (params.rate ()))
    {
      LOG (WARNING) << "Invalid rate: " << params.rate ();
      return false;
    }
  if (!IsAmount (params.administrator_rate ()))
    {
      LOG (WARNING)
          << "Invalid administrator rate: " << params.administrator_rate ();
      return false;
    }

  if (!IsAmount (params.min_contribution ())
        || params.max_contribution () <= 0
        || !IsAmount (params.max_contribution ())
        || params.min_contribution () > params.max_contribution ())
    {
      LOG (WARNING)
          << "Invalid contribution bounds: " << params.min_contribution ()
          << " to " << params.max_contribution ();
      return false;
    }

  if (params.bonus_percent () < 0 || params.bonus_percent () > 100)
    {
      LOG (WARNING) << "Invalid bonus percentage: " << params.bonus_percent ();
      return false;
    }

  if (params.share_account ().empty () || params.controller ().empty ())
    {
      LOG (WARNING) << "Share account and controller account must be set";
      return false;
    }

  return true;
}

bool
ValidateVestingParams (const proto::VestingParams& params)
{
  if (params.num_intervals () == 0)
    {
      LOG (WARNING) << "The vesting schedule needs at least one interval";
      return false;
    }

  if (params.interval_duration () <= 0)
    {
      LOG (WARNING)
          << "Invalid interval duration: " << params.interval_duration ();
      return false;
    }

  return true;
}

bool
ValidateSaleConfig (const proto::SaleConfig& cfg)
{
  if (cfg.administrator ().empty ())
    {
      LOG (WARNING) << "No administrator configured";
      return false;
    }

  if (!cfg.has_sale () || !ValidateSaleParams (cfg.sale ()))
    return false;
  if (!cfg.has_vesting () || !ValidateVestingParams (cfg.vesting ()))
    return false;

  for (const auto& name : cfg.whitelist ())
    if (name.empty ())
      {
        LOG (WARNING) << "Empty account name on the whitelist";
        return false;
      }

  return true;
}

} // namespace vestsale
