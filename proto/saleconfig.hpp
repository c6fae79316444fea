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

#ifndef PROTO_SALECONFIG_HPP
#define PROTO_SALECONFIG_HPP

#include "config.pb.h"

#include <string>

namespace vestsale
{

/**
 * Parses a SaleConfig from protocol buffer text format.  Returns false
 * if the text is invalid.
 */
bool ParseSaleConfig (const std::string& text, proto::SaleConfig& cfg);

/**
 * Reads and parses a SaleConfig text file.
 */
bool LoadSaleConfig (const std::string& file, proto::SaleConfig& cfg);

/**
 * Checks that the sale parameters are consistent (positive rate and
 * capacity, ordered bounds and time window, and so on).  Problems are
 * logged as warnings.
 */
bool ValidateSaleParams (const proto::SaleParams& params);

/**
 * Checks that the vesting schedule is usable.
 */
bool ValidateVestingParams (const proto::VestingParams& params);

/**
 * Validates a full configuration for initialising a fresh sale.
 */
bool ValidateSaleConfig (const proto::SaleConfig& cfg);

} // namespace vestsale

#endif // PROTO_SALECONFIG_HPP
