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

#ifndef VESTSALE_OPERATIONS_HPP
#define VESTSALE_OPERATIONS_HPP

#include "sale.hpp"

#include <json/json.h>

#include <string>

namespace vestsale
{

/**
 * Processor for sale operations given as JSON.  Each operation is an
 * object of the form
 *
 *   {"name": caller, "op": OP}
 *
 * where OP is an object with exactly one of these keys:
 *
 *   "contribute": amount
 *   "direct": {"to": beneficiary, "amount": reward units}
 *   "bonus": {"to": beneficiary, "amount": reward units}
 *   "release": true
 *   "finalise": true
 *   "whitelist": {"add": [names]} or {"remove": [names]}
 *   "config": {"capacity": amount}, {"max": amount} or {"end": time}
 *   "admin": {"transfer": new admin} or {"accept": true}
 *
 * Malformed operations are logged and skipped.  Operations that fail
 * are reported with their error code in the result.
 */
class OperationProcessor
{

private:

  /** The sale the operations are applied to.  */
  Sale& sale;

  /**
   * Parses the operation and executes it.  Returns false if the operation
   * is malformed.  SaleError exceptions propagate to the caller.
   */
  bool Execute (const std::string& name, const Json::Value& op,
                Json::Value& result);

  bool ExecuteDirectOrBonus (const std::string& name, bool bonus,
                             const Json::Value& val, Json::Value& result);
  bool ExecuteWhitelist (const std::string& name, const Json::Value& val,
                         Json::Value& result);
  bool ExecuteConfig (const std::string& name, const Json::Value& val);
  bool ExecuteAdmin (const std::string& name, const Json::Value& val);

public:

  explicit OperationProcessor (Sale& s)
    : sale(s)
  {}

  OperationProcessor () = delete;
  OperationProcessor (const OperationProcessor&) = delete;
  void operator= (const OperationProcessor&) = delete;

  /**
   * Processes a single operation and returns its result:
   *
   *   {"name": caller, "type": key, "success": bool, ...}
   *
   * Failed operations have "error" (the error name) and "code" set,
   * and malformed ones have "malformed": true.
   */
  Json::Value ProcessOne (const Json::Value& opObj);

  /**
   * Processes an array of operations in order and returns the array
   * of their results.
   */
  Json::Value ProcessAll (const Json::Value& ops);

};

} // namespace vestsale

#endif // VESTSALE_OPERATIONS_HPP
